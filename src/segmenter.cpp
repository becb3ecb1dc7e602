// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "segmenter.h"
#include "log.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace meetscribe {

namespace {

struct Span {
    int64_t begin;
    int64_t end;
};

AudioChunk make_chunk(const AudioBuffer& audio, int index, int64_t begin, int64_t end) {
    AudioChunk chunk;
    chunk.index = index;
    chunk.start_sample = begin;
    chunk.sample_rate = audio.sample_rate;
    chunk.channels = audio.channels;
    chunk.samples.assign(audio.samples.begin() + begin, audio.samples.begin() + end);
    return chunk;
}

// Cut positions inside the buffer, one per interior silence.
std::vector<int64_t> silence_cuts(const std::vector<SilenceInterval>& silences,
                                  int64_t total, int64_t keep) {
    std::vector<int64_t> cuts;
    for (const auto& s : silences) {
        // Leading/trailing silence stays attached to its neighbour
        if (s.start_sample == 0 || s.end_sample >= total) continue;
        int64_t len = s.end_sample - s.start_sample;
        int64_t cut = s.start_sample + std::min(keep, len / 2);
        if (cut > 0 && cut < total && (cuts.empty() || cut > cuts.back()))
            cuts.push_back(cut);
    }
    return cuts;
}

} // anonymous namespace

double dbfs(const float* samples, size_t count) {
    if (count == 0) return -std::numeric_limits<double>::infinity();
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i)
        sum += static_cast<double>(samples[i]) * samples[i];
    double rms = std::sqrt(sum / count);
    if (rms <= 0.0) return -std::numeric_limits<double>::infinity();
    return 20.0 * std::log10(rms);
}

double mean_dbfs(const std::vector<float>& samples) {
    return dbfs(samples.data(), samples.size());
}

std::vector<SilenceInterval> detect_silence(const std::vector<float>& samples,
                                            const SegmenterOptions& opts, int sample_rate) {
    if (sample_rate <= 0)
        throw MeetscribeError("Invalid sample rate: " + std::to_string(sample_rate));

    std::vector<SilenceInterval> result;
    if (samples.empty()) return result;

    const int64_t total = static_cast<int64_t>(samples.size());
    const int64_t frame = std::max<int64_t>(1, static_cast<int64_t>(sample_rate) * opts.frame_ms / 1000);
    const int64_t min_len = static_cast<int64_t>(sample_rate) * opts.min_silence_ms / 1000;
    const double threshold = mean_dbfs(samples) - opts.silence_margin_db;

    int64_t run_start = -1;
    for (int64_t pos = 0; pos < total; pos += frame) {
        size_t n = static_cast<size_t>(std::min(frame, total - pos));
        bool silent = dbfs(samples.data() + pos, n) < threshold;

        if (silent && run_start < 0) {
            run_start = pos;
        } else if (!silent && run_start >= 0) {
            if (pos - run_start >= min_len)
                result.push_back({run_start, pos});
            run_start = -1;
        }
    }
    if (run_start >= 0 && total - run_start >= min_len)
        result.push_back({run_start, total});

    return result;
}

std::vector<AudioChunk> split_audio(const AudioBuffer& audio, const SegmenterOptions& opts) {
    if (opts.max_chunk_seconds <= 0.0)
        throw MeetscribeError("max_chunk_seconds must be positive");

    std::vector<AudioChunk> chunks;
    const int64_t total = static_cast<int64_t>(audio.samples.size());
    if (total == 0) return chunks;

    const int64_t max_len = std::max<int64_t>(
        1, static_cast<int64_t>(std::floor(opts.max_chunk_seconds * audio.sample_rate)));

    if (total <= max_len) {
        chunks.push_back(make_chunk(audio, 0, 0, total));
        log_info("Audio %.1fs fits in one chunk", audio.duration());
        return chunks;
    }

    auto silences = detect_silence(audio.samples, opts, audio.sample_rate);
    const int64_t keep = static_cast<int64_t>(audio.sample_rate) * opts.keep_silence_ms / 1000;
    auto cuts = silence_cuts(silences, total, keep);

    // Silence-delimited segments; anything longer than the limit is hard-cut.
    std::vector<Span> segments;
    int64_t begin = 0;
    size_t hard_cuts = 0;
    auto add_segment = [&](int64_t b, int64_t e) {
        while (e - b > max_len) {
            segments.push_back({b, b + max_len});
            b += max_len;
            ++hard_cuts;
        }
        if (e > b) segments.push_back({b, e});
    };
    for (int64_t cut : cuts) {
        add_segment(begin, cut);
        begin = cut;
    }
    add_segment(begin, total);

    // Greedy first-fit packing along the timeline
    Span current{0, 0};
    for (const auto& seg : segments) {
        int64_t current_len = current.end - current.begin;
        int64_t seg_len = seg.end - seg.begin;
        if (current_len + seg_len <= max_len) {
            if (current_len == 0) current.begin = seg.begin;
            current.end = seg.end;
        } else {
            chunks.push_back(make_chunk(audio, static_cast<int>(chunks.size()),
                                        current.begin, current.end));
            current = seg;
        }
    }
    if (current.end > current.begin)
        chunks.push_back(make_chunk(audio, static_cast<int>(chunks.size()),
                                    current.begin, current.end));

    if (cuts.empty())
        log_warn("No usable silence in %.1fs audio; hard-cutting at %.0fs",
                 audio.duration(), opts.max_chunk_seconds);
    log_info("Split %.1fs audio into %zu chunks (%zu silence cuts, %zu hard cuts)",
             audio.duration(), chunks.size(), cuts.size(), hard_cuts);
    return chunks;
}

} // namespace meetscribe
