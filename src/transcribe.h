// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "segmenter.h"
#include "util.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace meetscribe {

// ---------------------------------------------------------------------------
// Transcript types
// ---------------------------------------------------------------------------

struct WordSpan {
    std::string text;
    double start;  // seconds, relative to the owning chunk (or global once merged)
    double end;
    int speaker;   // 1-based diarization tag, only meaningful within one chunk
};

struct ChunkResult {
    int chunk_index = 0;
    std::vector<WordSpan> words;
    int speaker_count = 0;  // highest speaker tag seen in this chunk
};

/// Highest speaker tag among the words (0 for no words).
int local_speaker_count(const std::vector<WordSpan>& words);

// ---------------------------------------------------------------------------
// Remote recognition service
// ---------------------------------------------------------------------------

struct RecognitionConfig {
    std::string language;            // "it", "en", ...
    int sample_rate = SAMPLE_RATE;
    std::string encoding = "FLAC";
    std::string model = "video";
    bool automatic_punctuation = true;
    bool word_time_offsets = true;
    bool diarization = true;
    int min_speakers = 1;
    int max_speakers = 10;
};

/// Long-running recognition: submit a job, then poll it until it completes.
/// Implementations throw RemoteUnavailable / RemoteTimeout / RemoteRejected.
class RecognitionService {
public:
    virtual ~RecognitionService() = default;

    /// Start recognition of an encoded (FLAC) chunk. Returns an operation handle.
    virtual std::string submit(const std::string& audio, const RecognitionConfig& config) = 0;

    /// Poll an operation. nullopt while still running; words once done.
    virtual std::optional<std::vector<WordSpan>> poll(const std::string& operation) = 0;
};

// ---------------------------------------------------------------------------
// ChunkTranscriber: per-chunk client with retry and wait deadline
// ---------------------------------------------------------------------------

struct TranscriberOptions {
    std::string model = "video";
    int max_speakers = 10;
    std::chrono::milliseconds wait_timeout = std::chrono::minutes(15);
    std::chrono::milliseconds poll_interval = std::chrono::seconds(2);
    int max_attempts = 3;                                      // submit attempts
    int max_poll_attempts = 5;                                 // consecutive failed polls
    std::chrono::milliseconds initial_backoff = std::chrono::seconds(1);
    double backoff_multiplier = 2.0;
};

class ChunkTranscriber {
public:
    using Clock = std::chrono::steady_clock;

    /// service must outlive the transcriber and be safe to call concurrently.
    ChunkTranscriber(RecognitionService& service, TranscriberOptions opts = {});

    /// Transcribe one chunk. Blocks until the remote job finishes, the wait
    /// deadline passes (RemoteTimeout), or stop is requested (CancelledError).
    /// A failed submit, or a remote job ending in RemoteUnavailable or
    /// RemoteTimeout, resubmits the chunk with exponential backoff up to
    /// max_attempts. A failed poll request is retried against the same
    /// operation up to max_poll_attempts times in a row, within the same wait
    /// deadline. Exhausting either budget rethrows the last error.
    /// RemoteRejected is never retried.
    ChunkResult transcribe(const AudioChunk& chunk, const std::string& language,
                           const StopToken& stop) const;

    ChunkResult transcribe(const AudioChunk& chunk, const std::string& language) const;

    const TranscriberOptions& options() const { return opts_; }

private:
    std::vector<WordSpan> wait_for(const std::string& operation, int chunk_index,
                                   const StopToken& stop) const;

    RecognitionService& service_;
    TranscriberOptions opts_;
};

} // namespace meetscribe
