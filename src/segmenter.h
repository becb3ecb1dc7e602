// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "audio_file.h"

#include <cstdint>
#include <vector>

namespace meetscribe {

struct SilenceInterval {
    int64_t start_sample;  // inclusive
    int64_t end_sample;    // exclusive
};

struct AudioChunk {
    int index = 0;
    int64_t start_sample = 0;  // position in the normalized source buffer
    std::vector<float> samples;
    int sample_rate = SAMPLE_RATE;
    int channels = CHANNELS;

    double start() const { return static_cast<double>(start_sample) / sample_rate; }
    double duration() const { return static_cast<double>(samples.size()) / sample_rate; }
};

struct SegmenterOptions {
    double max_chunk_seconds = 300.0;
    double silence_margin_db = 14.0;  // threshold = mean dBFS - margin
    int min_silence_ms = 1000;
    int keep_silence_ms = 500;        // trailing silence kept after speech
    int frame_ms = 10;                // loudness analysis window
};

/// Loudness of a sample range in dBFS. -infinity for digital silence.
double dbfs(const float* samples, size_t count);

/// Loudness of the whole buffer in dBFS.
double mean_dbfs(const std::vector<float>& samples);

/// Find silent runs at least min_silence_ms long whose frames are all below
/// (mean_dbfs - silence_margin_db). Returned in order, non-overlapping.
std::vector<SilenceInterval> detect_silence(const std::vector<float>& samples,
                                            const SegmenterOptions& opts = {},
                                            int sample_rate = SAMPLE_RATE);

/// Split a normalized buffer into chunks of at most opts.max_chunk_seconds,
/// cutting at silence where possible and hard-cutting otherwise. Chunks are
/// contiguous, non-overlapping and cover every sample exactly once.
/// An empty buffer yields no chunks.
std::vector<AudioChunk> split_audio(const AudioBuffer& audio,
                                    const SegmenterOptions& opts = {});

} // namespace meetscribe
