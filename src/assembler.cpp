// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "assembler.h"
#include "log.h"

#include <algorithm>
#include <sstream>

namespace meetscribe {

std::string format_speaker(int speaker) {
    return "Speaker " + std::to_string(speaker) + ": ";
}

std::string render_transcript(const std::vector<WordSpan>& words) {
    std::ostringstream oss;
    bool first = true;
    int current = 0;
    for (const auto& w : words) {
        if (first || w.speaker != current) {
            if (!first) oss << "\n";
            oss << format_speaker(w.speaker);
            current = w.speaker;
        } else {
            oss << " ";
        }
        oss << w.text;
        first = false;
    }
    return oss.str();
}

TranscriptResult merge_chunks(std::vector<ChunkResult> results) {
    std::stable_sort(results.begin(), results.end(),
                     [](const ChunkResult& a, const ChunkResult& b) {
                         return a.chunk_index < b.chunk_index;
                     });
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].chunk_index != static_cast<int>(i))
            throw AssemblyError("Chunk indices are not contiguous: expected " +
                                std::to_string(i) + ", got " +
                                std::to_string(results[i].chunk_index));
    }

    TranscriptResult out;
    double timeline_offset = 0.0;

    for (auto& chunk : results) {
        if (!chunk.words.empty()) {
            double chunk_end = timeline_offset;
            for (auto& w : chunk.words) {
                w.start += timeline_offset;
                w.end += timeline_offset;
                chunk_end = std::max(chunk_end, w.end);
                out.words.push_back(std::move(w));
            }
            timeline_offset = chunk_end;
        }
        out.speaker_count = std::max(out.speaker_count, chunk.speaker_count);
    }

    std::stable_sort(out.words.begin(), out.words.end(),
                     [](const WordSpan& a, const WordSpan& b) { return a.start < b.start; });

    out.text = render_transcript(out.words);
    out.duration_seconds = static_cast<int>(timeline_offset);

    log_info("Assembled %zu chunks: %zu words, %ds, %d speakers",
             results.size(), out.words.size(), out.duration_seconds, out.speaker_count);
    return out;
}

} // namespace meetscribe
