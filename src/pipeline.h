// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "assembler.h"
#include "audio_file.h"
#include "job.h"
#include "segmenter.h"
#include "summarize.h"
#include "transcribe.h"
#include "util.h"

#include <functional>
#include <string>
#include <vector>

namespace meetscribe {

struct PipelineOptions {
    SegmenterOptions segmenter;
    int max_in_flight = 4;  // concurrent chunk transcriptions
};

/// Called with each phase name: "segmenting", "transcribing", "assembling", "complete".
using PhaseCallback = std::function<void(const std::string&)>;

class TranscriptionOrchestrator {
public:
    /// transcriber must outlive the orchestrator.
    explicit TranscriptionOrchestrator(const ChunkTranscriber& transcriber,
                                       PipelineOptions opts = {});

    /// Decode, segment, transcribe and assemble one recording.
    /// Throws UnsupportedLanguageError, DecodeError, the first fatal chunk
    /// error, or CancelledError when stop is requested. Never returns a
    /// partial transcript.
    TranscriptResult run(const std::string& audio_bytes, const std::string& language,
                         StopToken& stop, PhaseCallback on_phase = nullptr) const;

    /// Same, for audio that is already decoded and normalized.
    TranscriptResult run(const AudioBuffer& audio, const std::string& language,
                         StopToken& stop, PhaseCallback on_phase = nullptr) const;

    /// Transcribe chunks on at most max_in_flight threads. Results are
    /// returned in chunk order regardless of completion order.
    std::vector<ChunkResult> transcribe_chunks(const std::vector<AudioChunk>& chunks,
                                               const std::string& language,
                                               StopToken& stop) const;

    const PipelineOptions& options() const { return opts_; }

private:
    const ChunkTranscriber& transcriber_;
    PipelineOptions opts_;
};

/// Process one job end to end: mark it processing, transcribe, summarize,
/// then record either SetDone plus the consumed seconds for the caller's
/// usage period, or SetError with the failure kind. Returns the final update.
/// A failing summarizer degrades to basic_summary(); it never fails the job.
StatusUpdate run_job(const TranscriptionOrchestrator& orchestrator,
                     const JobDescriptor& job,
                     const std::string& audio_bytes,
                     JobSink& sink,
                     const SummarizeFn& summarize,
                     const SystemClock& clock,
                     StopToken& stop);

} // namespace meetscribe
