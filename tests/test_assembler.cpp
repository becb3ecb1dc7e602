// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "assembler.h"

using namespace meetscribe;
using Catch::Matchers::WithinAbs;

static ChunkResult chunk(int index, std::vector<WordSpan> words) {
    ChunkResult r;
    r.chunk_index = index;
    r.words = std::move(words);
    r.speaker_count = local_speaker_count(r.words);
    return r;
}

TEST_CASE("format_speaker: label text", "[assembler]") {
    CHECK(format_speaker(1) == "Speaker 1: ");
    CHECK(format_speaker(12) == "Speaker 12: ");
}

TEST_CASE("render_transcript: groups consecutive words by speaker", "[assembler]") {
    std::vector<WordSpan> words = {
        {"hello", 0.0, 0.5, 1}, {"there", 0.5, 1.0, 1},
        {"hi", 1.2, 1.5, 2},
        {"bye", 2.0, 2.4, 1},
    };
    CHECK(render_transcript(words) == "Speaker 1: hello there\nSpeaker 2: hi\nSpeaker 1: bye");
}

TEST_CASE("render_transcript: empty input", "[assembler]") {
    CHECK(render_transcript({}).empty());
}

TEST_CASE("merge_chunks: zero chunks is an empty transcript", "[assembler]") {
    auto result = merge_chunks({});
    CHECK(result.text.empty());
    CHECK(result.duration_seconds == 0);
    CHECK(result.speaker_count == 0);
    CHECK(result.words.empty());
}

TEST_CASE("merge_chunks: all chunks empty", "[assembler]") {
    auto result = merge_chunks({chunk(0, {}), chunk(1, {})});
    CHECK(result.text.empty());
    CHECK(result.duration_seconds == 0);
    CHECK(result.speaker_count == 0);
}

TEST_CASE("merge_chunks: same speaker across boundary stays one turn", "[assembler]") {
    auto result = merge_chunks({
        chunk(0, {{"uno", 0.0, 1.0, 1}}),
        chunk(1, {{"due", 0.0, 2.0, 1}}),
    });

    CHECK(result.text == "Speaker 1: uno due");
    CHECK(result.duration_seconds == 3);
    CHECK(result.speaker_count == 1);
    REQUIRE(result.words.size() == 2);
    CHECK_THAT(result.words[1].start, WithinAbs(1.0, 1e-9));
    CHECK_THAT(result.words[1].end, WithinAbs(3.0, 1e-9));
}

TEST_CASE("merge_chunks: changed tag at boundary starts a new turn", "[assembler]") {
    auto result = merge_chunks({
        chunk(0, {{"first", 0.0, 0.5, 1}, {"answer", 0.6, 1.4, 2}}),
        chunk(1, {{"next", 0.0, 0.5, 1}}),
    });
    CHECK(result.text == "Speaker 1: first\nSpeaker 2: answer\nSpeaker 1: next");
}

TEST_CASE("merge_chunks: offset of B's first word equals A's last end", "[assembler]") {
    ChunkResult a = chunk(0, {{"a1", 0.3, 1.1, 1}, {"a2", 1.2, 4.75, 1}});
    ChunkResult b = chunk(1, {{"b1", 0.0, 0.5, 2}});

    auto only_a = merge_chunks({a});
    auto both = merge_chunks({a, b});

    double a_end = only_a.words.back().end;
    REQUIRE(both.words.size() == 3);
    CHECK_THAT(both.words[2].start, WithinAbs(a_end, 1e-9));
    CHECK_THAT(both.words[2].start, WithinAbs(4.75, 1e-9));
}

TEST_CASE("merge_chunks: empty chunk leaves the offset unchanged", "[assembler]") {
    auto result = merge_chunks({
        chunk(0, {{"x", 0.0, 2.0, 1}}),
        chunk(1, {}),
        chunk(2, {{"y", 0.5, 1.0, 1}}),
    });
    REQUIRE(result.words.size() == 2);
    CHECK_THAT(result.words[1].start, WithinAbs(2.5, 1e-9));
    CHECK(result.duration_seconds == 3);
}

TEST_CASE("merge_chunks: speaker count is the max of local counts", "[assembler]") {
    ChunkResult a; a.chunk_index = 0; a.speaker_count = 2;
    ChunkResult b; b.chunk_index = 1; b.speaker_count = 5;
    ChunkResult c; c.chunk_index = 2; c.speaker_count = 3;
    CHECK(merge_chunks({a, b, c}).speaker_count == 5);
}

TEST_CASE("merge_chunks: duration truncates to whole seconds", "[assembler]") {
    auto result = merge_chunks({chunk(0, {{"w", 0.0, 7.9, 1}})});
    CHECK(result.duration_seconds == 7);
}

TEST_CASE("merge_chunks: results in completion order are reordered", "[assembler]") {
    auto result = merge_chunks({
        chunk(1, {{"world", 0.0, 1.0, 1}}),
        chunk(0, {{"hello", 0.0, 1.0, 1}}),
    });
    CHECK(result.text == "Speaker 1: hello world");
    CHECK(result.duration_seconds == 2);
}

TEST_CASE("merge_chunks: overlapping words sort stably by start", "[assembler]") {
    // b and c both start at 2.0 globally; the tie keeps chunk order
    auto result = merge_chunks({
        chunk(0, {{"a", 0.0, 2.0, 1}, {"b", 2.0, 2.0, 1}}),
        chunk(1, {{"c", 0.0, 0.5, 2}}),
    });
    REQUIRE(result.words.size() == 3);
    CHECK(result.words[0].text == "a");
    CHECK(result.words[1].text == "b");
    CHECK(result.words[2].text == "c");
}

TEST_CASE("merge_chunks: index gaps are an assembly error", "[assembler]") {
    CHECK_THROWS_AS(merge_chunks({chunk(0, {}), chunk(2, {})}), AssemblyError);
    CHECK_THROWS_AS(merge_chunks({chunk(1, {})}), AssemblyError);
    CHECK_THROWS_AS(merge_chunks({chunk(0, {}), chunk(0, {})}), AssemblyError);
}
