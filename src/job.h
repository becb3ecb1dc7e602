// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"

#include <chrono>
#include <functional>
#include <string>
#include <variant>

namespace meetscribe {

/// Languages the recognition and summary prompts are set up for.
bool is_supported_language(const std::string& code);

/// Throws UnsupportedLanguageError unless is_supported_language(code).
void require_supported_language(const std::string& code);

struct JobDescriptor {
    std::string id;
    std::string caller;             // opaque authenticated identity
    std::string language;
    std::string original_filename;
    std::string audio_uri;          // where the caller archived the upload, may be empty
};

// ---------------------------------------------------------------------------
// Status updates: the closed set of changes a job record can receive
// ---------------------------------------------------------------------------

struct SetProcessing {};

struct SetDone {
    std::string transcript_text;
    std::string summary_text;
    int duration_seconds = 0;
    int speaker_count = 0;
    std::string audio_uri;
};

struct SetError {
    ErrorKind kind = ErrorKind::Internal;
};

using StatusUpdate = std::variant<SetProcessing, SetDone, SetError>;

/// "processing", "done" or "error".
const char* status_name(const StatusUpdate& update);

/// Durable storage for job records and usage counters.
class JobSink {
public:
    virtual ~JobSink() = default;

    virtual void update(const std::string& job_id, const StatusUpdate& update) = 0;

    /// Add seconds to the caller's counter for a billing period ("YYYY-MM-01").
    virtual void record_usage(const std::string& caller, const std::string& period,
                              int seconds) = 0;
};

using SystemClock = std::function<std::chrono::system_clock::time_point()>;

/// First day of the UTC calendar month containing t, as "YYYY-MM-01".
std::string usage_period(std::chrono::system_clock::time_point t);

} // namespace meetscribe
