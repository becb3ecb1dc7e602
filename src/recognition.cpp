// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "recognition.h"
#include "log.h"

#include <nlohmann/json.hpp>

#include <cstdlib>

namespace meetscribe {

using json = nlohmann::json;

namespace {

// google.rpc.Code values that are worth distinguishing
constexpr int RPC_DEADLINE_EXCEEDED = 4;
constexpr int RPC_UNAVAILABLE = 14;

json parse_json(const std::string& text, const char* what) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw RemoteRejected(std::string("Malformed ") + what + " from recognition service: " +
                             e.what());
    }
}

double duration_value(const json& j) {
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) return parse_duration_seconds(j.get<std::string>());
    if (j.is_object()) {
        // {"seconds": "1", "nanos": 500000000}
        double secs = 0.0;
        if (j.contains("seconds")) {
            const auto& s = j["seconds"];
            secs = s.is_string() ? std::atof(s.get<std::string>().c_str()) : s.get<double>();
        }
        if (j.contains("nanos"))
            secs += j["nanos"].get<double>() / 1e9;
        return secs;
    }
    return 0.0;  // proto3 JSON omits zero durations
}

std::vector<WordSpan> words_of(const json& result) {
    std::vector<WordSpan> words;
    if (!result.contains("alternatives") || result["alternatives"].empty())
        return words;
    const auto& alt = result["alternatives"][0];
    if (!alt.contains("words"))
        return words;

    for (const auto& w : alt["words"]) {
        WordSpan span;
        span.text = w.value("word", "");
        span.start = w.contains("startTime") ? duration_value(w["startTime"]) : 0.0;
        span.end = w.contains("endTime") ? duration_value(w["endTime"]) : span.start;
        span.speaker = w.value("speakerTag", 0);
        words.push_back(std::move(span));
    }
    return words;
}

bool has_speaker_tags(const std::vector<WordSpan>& words) {
    for (const auto& w : words)
        if (w.speaker > 0) return true;
    return false;
}

[[noreturn]] void throw_remote(const HttpError& e, const char* action) {
    std::string msg = std::string("Recognition ") + action + " failed: " + e.what();
    switch (classify_http_failure(e.status(), e.timed_out())) {
        case ErrorKind::RemoteUnavailable: throw RemoteUnavailable(msg, true);
        case ErrorKind::RemoteTimeout:     throw RemoteTimeout(msg, true);
        default:                           throw RemoteRejected(msg, true);
    }
}

} // anonymous namespace

double parse_duration_seconds(const std::string& text) {
    std::string s = text;
    if (!s.empty() && s.back() == 's')
        s.pop_back();
    if (s.empty())
        throw RemoteRejected("Empty duration value");

    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0')
        throw RemoteRejected("Malformed duration: " + text);
    return value;
}

std::string build_recognize_request(const RecognitionConfig& config, const std::string& audio) {
    json body = {
        {"config", {
            {"encoding", config.encoding},
            {"sampleRateHertz", config.sample_rate},
            {"languageCode", config.language},
            {"model", config.model},
            {"enableAutomaticPunctuation", config.automatic_punctuation},
            {"enableWordTimeOffsets", config.word_time_offsets},
            {"diarizationConfig", {
                {"enableSpeakerDiarization", config.diarization},
                {"minSpeakerCount", config.min_speakers},
                {"maxSpeakerCount", config.max_speakers},
            }},
        }},
        {"audio", {{"content", base64_encode(audio)}}},
    };
    return body.dump();
}

std::string parse_operation_name(const std::string& text) {
    json j = parse_json(text, "submit response");
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string())
        throw RemoteRejected("Submit response carries no operation name");
    return j["name"].get<std::string>();
}

std::optional<std::vector<WordSpan>> parse_operation(const std::string& text) {
    json j = parse_json(text, "operation");
    if (!j.is_object())
        throw RemoteRejected("Operation response is not an object");

    if (j.contains("error")) {
        const auto& err = j["error"];
        int code = err.value("code", 0);
        std::string msg = "Recognition failed (code " + std::to_string(code) + "): " +
                          err.value("message", std::string("no message"));
        if (code == RPC_UNAVAILABLE) throw RemoteUnavailable(msg);
        if (code == RPC_DEADLINE_EXCEEDED) throw RemoteTimeout(msg);
        throw RemoteRejected(msg);
    }

    if (!j.value("done", false))
        return std::nullopt;

    std::vector<WordSpan> words;
    if (!j.contains("response") || !j["response"].contains("results"))
        return words;  // done, no speech recognized

    const auto& results = j["response"]["results"];
    if (results.empty())
        return words;

    auto last = words_of(results.back());
    if (has_speaker_tags(last))
        return last;

    for (const auto& r : results) {
        auto part = words_of(r);
        words.insert(words.end(), std::make_move_iterator(part.begin()),
                     std::make_move_iterator(part.end()));
    }
    return words;
}

ErrorKind classify_http_failure(long status, bool timed_out) {
    if (status == 0)
        return timed_out ? ErrorKind::RemoteTimeout : ErrorKind::RemoteUnavailable;
    if (status == 408 || status == 429 || status >= 500)
        return ErrorKind::RemoteUnavailable;
    return ErrorKind::RemoteRejected;
}

HttpRecognitionService::HttpRecognitionService(HttpRecognitionOptions opts)
    : opts_(std::move(opts)) {
    if (opts_.base_url.empty())
        throw MeetscribeError("Recognition service URL is not configured");
    while (!opts_.base_url.empty() && opts_.base_url.back() == '/')
        opts_.base_url.pop_back();
}

HttpHeaders HttpRecognitionService::headers() const {
    HttpHeaders h;
    if (!opts_.api_key.empty())
        h["X-Goog-Api-Key"] = opts_.api_key;
    return h;
}

std::string HttpRecognitionService::submit(const std::string& audio,
                                           const RecognitionConfig& config) {
    std::string url = opts_.base_url + "/speech:longrunningrecognize";
    std::string response;
    try {
        response = http_post_json(url, build_recognize_request(config, audio), headers(),
                                  opts_.request_timeout_seconds);
    } catch (const HttpError& e) {
        if (!e.body().empty())
            log_warn("Recognition submit error body: %s", e.body().c_str());
        throw_remote(e, "submit");
    }
    return parse_operation_name(response);
}

std::optional<std::vector<WordSpan>> HttpRecognitionService::poll(const std::string& operation) {
    std::string url = opts_.base_url + "/operations/" + operation;
    std::string response;
    try {
        response = http_get(url, headers(), opts_.request_timeout_seconds);
    } catch (const HttpError& e) {
        throw_remote(e, "poll");
    }
    return parse_operation(response);
}

} // namespace meetscribe
