// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"

#include <functional>
#include <string>

namespace meetscribe {

/// Build the user prompt for meeting summarization in the meeting's language
/// ("it" gets an Italian prompt, anything else English).
std::string build_user_prompt(const std::string& transcript, const std::string& language);

/// Chat completion request body: system and user messages for the transcript.
std::string build_summary_request(const std::string& transcript, const std::string& language,
                                  const std::string& model);

/// choices[0].message.content of a chat completion response.
/// Throws MeetscribeError when it is missing, empty or not valid JSON.
std::string parse_summary_response(const std::string& json);

/// Summarize a transcript using an OpenAI-compatible chat completion API.
std::string summarize_http(const std::string& transcript,
                           const std::string& language,
                           const std::string& api_url,
                           const std::string& api_key,
                           const std::string& model);

/// Offline summary: the first three and last two sentences, with a
/// localized heading. Used when no summarization service is reachable.
std::string basic_summary(const std::string& transcript, const std::string& language);

/// (transcript, language) -> summary text
using SummarizeFn = std::function<std::string(const std::string&, const std::string&)>;

struct SummaryOptions {
    std::string api_url;   // empty = offline summary only
    std::string api_key;
    std::string model = "gemini-pro";
    bool disabled = false;
};

/// Summarizer that tries the HTTP service when configured and falls back to
/// basic_summary() on any failure. Returns an empty summary when disabled.
SummarizeFn make_summarizer(const SummaryOptions& opts);

} // namespace meetscribe
