// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include "summarize.h"

using namespace meetscribe;

TEST_CASE("build_user_prompt: English sections", "[summarize]") {
    std::string prompt = build_user_prompt("Some transcript text.", "en");

    CHECK(prompt.find("**Summary**") != std::string::npos);
    CHECK(prompt.find("**Key Points**") != std::string::npos);
    CHECK(prompt.find("**Action Items**") != std::string::npos);
    CHECK(prompt.find("respond in English") != std::string::npos);
}

TEST_CASE("build_user_prompt: Italian sections", "[summarize]") {
    std::string prompt = build_user_prompt("Testo della riunione.", "it");

    CHECK(prompt.find("**Riassunto**") != std::string::npos);
    CHECK(prompt.find("**Punti chiave**") != std::string::npos);
    CHECK(prompt.find("**Azioni da intraprendere**") != std::string::npos);
    CHECK(prompt.find("Rispondi in italiano") != std::string::npos);
}

TEST_CASE("build_user_prompt: includes transcript after heading", "[summarize]") {
    std::string prompt = build_user_prompt("Hello world transcript.", "en");

    auto heading_pos = prompt.find("Transcription:");
    auto text_pos = prompt.find("Hello world transcript.");
    REQUIRE(heading_pos != std::string::npos);
    REQUIRE(text_pos != std::string::npos);
    CHECK(text_pos > heading_pos);
}

// ---------------------------------------------------------------------------
// Offline summary
// ---------------------------------------------------------------------------

TEST_CASE("basic_summary: short transcript kept whole", "[summarize]") {
    std::string s = basic_summary("One. Two. Three", "en");
    CHECK(s == "Automatic meeting summary:\n\nOne. Two. Three");
}

TEST_CASE("basic_summary: long transcript keeps first three and last two", "[summarize]") {
    std::string s = basic_summary("A. B. C. D. E. F. G", "en");
    CHECK(s == "Automatic meeting summary:\n\nA. B. C. F. G");
}

TEST_CASE("basic_summary: exactly five sentences kept whole", "[summarize]") {
    std::string s = basic_summary("A. B. C. D. E", "en");
    CHECK(s == "Automatic meeting summary:\n\nA. B. C. D. E");
}

TEST_CASE("basic_summary: Italian heading", "[summarize]") {
    std::string s = basic_summary("Ciao a tutti", "it");
    CHECK(s == "Riassunto automatico della riunione:\n\nCiao a tutti");
}

// ---------------------------------------------------------------------------
// make_summarizer
// ---------------------------------------------------------------------------

TEST_CASE("make_summarizer: disabled returns empty summary", "[summarize]") {
    SummaryOptions opts;
    opts.disabled = true;
    auto summarize = make_summarizer(opts);
    CHECK(summarize("Speaker 1: hello", "en").empty());
}

TEST_CASE("make_summarizer: no service configured uses basic summary", "[summarize]") {
    SummaryOptions opts;
    auto summarize = make_summarizer(opts);
    CHECK(summarize("Speaker 1: hello", "en") ==
          "Automatic meeting summary:\n\nSpeaker 1: hello");
}

TEST_CASE("make_summarizer: unreachable service falls back", "[summarize]") {
    SummaryOptions opts;
    opts.api_url = "http://127.0.0.1:1/v1/chat/completions";
    opts.api_key = "test-key";
    auto summarize = make_summarizer(opts);
    CHECK(summarize("Speaker 1: ciao", "it") ==
          "Riassunto automatico della riunione:\n\nSpeaker 1: ciao");
}
