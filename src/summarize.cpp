// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "summarize.h"
#include "http_client.h"
#include "log.h"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace meetscribe {

using json = nlohmann::json;

namespace {

const char* SYSTEM_PROMPT =
    "You are a precise meeting summarizer. Produce a well-structured Markdown summary "
    "in the language of the transcript. Use the exact section headings requested.";

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> out;
    size_t pos = 0;
    for (;;) {
        auto next = text.find(". ", pos);
        if (next == std::string::npos) {
            out.push_back(text.substr(pos));
            return out;
        }
        out.push_back(text.substr(pos, next - pos));
        pos = next + 2;
    }
}

} // anonymous namespace

std::string build_user_prompt(const std::string& transcript, const std::string& language) {
    std::ostringstream oss;
    if (language == "it") {
        oss << "Analizza questa trascrizione di una riunione e fornisci:\n\n"
            << "1. **Riassunto**: Un riassunto conciso dei punti principali discussi "
               "(2-3 paragrafi massimo)\n"
            << "2. **Punti chiave**: Una lista numerata dei punti più importanti\n"
            << "3. **Azioni da intraprendere**: Una lista delle azioni concrete da completare, "
               "con eventuali responsabili se menzionati\n\n"
            << "Trascrizione:\n" << transcript << "\n\n"
            << "Rispondi in italiano e usa un formato strutturato.\n";
    } else {
        oss << "Analyze this meeting transcription and provide:\n\n"
            << "1. **Summary**: A concise summary of the main points discussed "
               "(2-3 paragraphs maximum)\n"
            << "2. **Key Points**: A numbered list of the most important points\n"
            << "3. **Action Items**: A list of concrete actions to be completed, "
               "with responsible parties if mentioned\n\n"
            << "Transcription:\n" << transcript << "\n\n"
            << "Please respond in English and use a structured format.\n";
    }
    return oss.str();
}

std::string build_summary_request(const std::string& transcript, const std::string& language,
                                  const std::string& model) {
    json body = {
        {"model", model},
        {"messages", json::array({
            {{"role", "system"}, {"content", SYSTEM_PROMPT}},
            {{"role", "user"}, {"content", build_user_prompt(transcript, language)}},
        })},
        {"temperature", 0.3},
        {"max_tokens", 4096},
    };
    // Invalid UTF-8 in a transcript is replaced rather than failing the request
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string parse_summary_response(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw MeetscribeError(std::string("Malformed summary response: ") + e.what());
    }

    const json* content = nullptr;
    if (j.is_object() && j.contains("choices") && j["choices"].is_array() &&
        !j["choices"].empty()) {
        const auto& choice = j["choices"][0];
        if (choice.is_object() && choice.contains("message") && choice["message"].is_object() &&
            choice["message"].contains("content"))
            content = &choice["message"]["content"];
    }
    if (!content || !content->is_string() || content->get_ref<const std::string&>().empty())
        throw MeetscribeError("Empty summary response from API");
    return content->get<std::string>();
}

std::string summarize_http(const std::string& transcript,
                           const std::string& language,
                           const std::string& api_url,
                           const std::string& api_key,
                           const std::string& model) {
    log_info("Requesting summary from %s (model: %s)", api_url.c_str(), model.c_str());

    HttpHeaders headers;
    if (!api_key.empty())
        headers["Authorization"] = "Bearer " + api_key;

    std::string response = http_post_json(api_url,
                                          build_summary_request(transcript, language, model),
                                          headers);
    return parse_summary_response(response);
}

std::string basic_summary(const std::string& transcript, const std::string& language) {
    auto sentences = split_sentences(transcript);

    std::vector<std::string> picked;
    if (sentences.size() <= 5) {
        picked = sentences;
    } else {
        picked.assign(sentences.begin(), sentences.begin() + 3);
        picked.insert(picked.end(), sentences.end() - 2, sentences.end());
    }

    std::string summary;
    for (size_t i = 0; i < picked.size(); ++i) {
        if (i > 0) summary += ". ";
        summary += picked[i];
    }

    const char* prefix = (language == "it") ? "Riassunto automatico della riunione:\n\n"
                                            : "Automatic meeting summary:\n\n";
    return prefix + summary;
}

SummarizeFn make_summarizer(const SummaryOptions& opts) {
    return [opts](const std::string& transcript, const std::string& language) -> std::string {
        if (opts.disabled) {
            log_info("Summary skipped (disabled).");
            return "";
        }
        if (!opts.api_url.empty()) {
            try {
                return summarize_http(transcript, language, opts.api_url, opts.api_key,
                                      opts.model);
            } catch (const std::exception& e) {
                log_warn("Summary service failed: %s", e.what());
                log_warn("Falling back to basic summary.");
            }
        }
        return basic_summary(transcript, language);
    };
}

} // namespace meetscribe
