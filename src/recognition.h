// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "http_client.h"
#include "transcribe.h"

#include <optional>
#include <string>
#include <vector>

namespace meetscribe {

// ---------------------------------------------------------------------------
// Wire codec for a long-running-recognize REST API
// ---------------------------------------------------------------------------

/// Parse a protobuf-JSON duration ("1.500s") or a plain number of seconds.
/// Throws RemoteRejected on malformed input.
double parse_duration_seconds(const std::string& text);

/// Request body: {"config": {...}, "audio": {"content": base64}}.
std::string build_recognize_request(const RecognitionConfig& config, const std::string& audio);

/// Extract the operation name from a submit response.
std::string parse_operation_name(const std::string& json);

/// Decode an operation poll response. nullopt while "done" is false.
/// An "error" object maps to RemoteUnavailable (code 14), RemoteTimeout
/// (code 4) or RemoteRejected (anything else).
/// When the final result carries speaker tags it holds the complete
/// diarized word list and is used alone; otherwise words of all results are
/// concatenated.
std::optional<std::vector<WordSpan>> parse_operation(const std::string& json);

/// Error category for a failed HTTP exchange with the recognition service.
ErrorKind classify_http_failure(long status, bool timed_out);

// ---------------------------------------------------------------------------
// HttpRecognitionService
// ---------------------------------------------------------------------------

struct HttpRecognitionOptions {
    std::string base_url = "https://speech.googleapis.com/v1";
    std::string api_key;
    long request_timeout_seconds = 120;
};

class HttpRecognitionService : public RecognitionService {
public:
    explicit HttpRecognitionService(HttpRecognitionOptions opts);

    std::string submit(const std::string& audio, const RecognitionConfig& config) override;
    std::optional<std::vector<WordSpan>> poll(const std::string& operation) override;

private:
    HttpHeaders headers() const;

    HttpRecognitionOptions opts_;
};

} // namespace meetscribe
