// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "job.h"

#include <ctime>

namespace meetscribe {

namespace {

const char* const SUPPORTED_LANGUAGES[] = {"it", "en"};

struct StatusNameVisitor {
    const char* operator()(const SetProcessing&) const { return "processing"; }
    const char* operator()(const SetDone&) const { return "done"; }
    const char* operator()(const SetError&) const { return "error"; }
};

} // anonymous namespace

bool is_supported_language(const std::string& code) {
    for (const char* lang : SUPPORTED_LANGUAGES)
        if (code == lang) return true;
    return false;
}

void require_supported_language(const std::string& code) {
    if (!is_supported_language(code))
        throw UnsupportedLanguageError("Language must be 'it' or 'en', got '" + code + "'");
}

const char* status_name(const StatusUpdate& update) {
    return std::visit(StatusNameVisitor{}, update);
}

std::string usage_period(std::chrono::system_clock::time_point t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    char buf[16];
    strftime(buf, sizeof(buf), "%Y-%m-01", &tm);
    return buf;
}

} // namespace meetscribe
