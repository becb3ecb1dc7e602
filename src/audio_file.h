// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"

#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe {

/// Decoded audio, normalized to SAMPLE_RATE mono float32 in [-1, 1].
struct AudioBuffer {
    std::vector<float> samples;
    int sample_rate = SAMPLE_RATE;
    int channels = CHANNELS;
    int source_sample_rate = 0;  // as found in the container
    int source_channels = 0;

    double duration() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/// Decode an in-memory container (WAV, FLAC, OGG, ... whatever libsndfile
/// supports) and normalize to SAMPLE_RATE mono.
/// Throws DecodeError if the bytes are not a supported container/codec.
AudioBuffer decode_audio(const std::string& bytes);

/// Read a file from disk and decode it. Throws DecodeError on failure.
AudioBuffer read_audio_file(const fs::path& path);

/// Read a whole file into memory. Throws MeetscribeError if unreadable.
std::string read_file_bytes(const fs::path& path);

/// Average interleaved frames down to one channel.
std::vector<float> downmix(const std::vector<float>& interleaved, int channels);

/// Linear-interpolation resampler. Returns input unchanged when rates match.
std::vector<float> resample_linear(const std::vector<float>& input,
                                   int input_rate, int output_rate);

/// Encode mono samples as a 16-bit FLAC stream in memory.
std::string encode_flac(const std::vector<float>& samples, int sample_rate = SAMPLE_RATE);

/// Encode interleaved samples as a 16-bit PCM WAV stream in memory.
std::string encode_wav(const std::vector<float>& samples, int sample_rate = SAMPLE_RATE,
                       int channels = CHANNELS);

} // namespace meetscribe
