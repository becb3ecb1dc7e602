// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "transcribe.h"

#include <string>
#include <vector>

namespace meetscribe {

struct TranscriptResult {
    std::string text;              // speaker-grouped rendering
    int duration_seconds = 0;      // final timeline offset, truncated
    int speaker_count = 0;         // max of per-chunk counts
    std::vector<WordSpan> words;   // rebased onto the global timeline, sorted by start
};

/// "Speaker 3: " style label for a chunk-local diarization tag.
std::string format_speaker(int speaker);

/// Render words (already in display order) as speaker turns:
/// "Speaker 1: hello there\nSpeaker 2: hi".
std::string render_transcript(const std::vector<WordSpan>& words);

/// Merge per-chunk results onto one timeline.
///
/// Results may arrive in any order but their indices must form 0..N-1
/// exactly once (AssemblyError otherwise). Each chunk's words are shifted
/// by the running offset, which then advances to that chunk's largest
/// rebased end time. Speaker tags are not reconciled across chunks: the
/// reported speaker count is the maximum local count, and a tag change at a
/// chunk boundary starts a new turn like any other.
TranscriptResult merge_chunks(std::vector<ChunkResult> results);

} // namespace meetscribe
