// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace meetscribe {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------

class MeetscribeError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Input bytes are not a container/codec we can decode.
class DecodeError : public MeetscribeError {
    using MeetscribeError::MeetscribeError;
};

class UnsupportedLanguageError : public MeetscribeError {
    using MeetscribeError::MeetscribeError;
};

/// Base for failures of the remote recognition service.
/// request_failed is set when a single HTTP exchange failed, as opposed to
/// the remote job reporting an error or running out of time.
class RemoteError : public MeetscribeError {
public:
    explicit RemoteError(const std::string& msg, bool request_failed = false)
        : MeetscribeError(msg), request_failed_(request_failed) {}

    bool request_failed() const { return request_failed_; }

private:
    bool request_failed_;
};

/// Transient: eligible for retry with backoff.
class RemoteUnavailable : public RemoteError {
    using RemoteError::RemoteError;
};

/// The recognition job (or a request) exceeded the allowed wait. Retried.
class RemoteTimeout : public RemoteError {
    using RemoteError::RemoteError;
};

/// Malformed audio, unsupported codec, bad request. Never retried.
class RemoteRejected : public RemoteError {
    using RemoteError::RemoteError;
};

/// Chunk ordering/indexing contract violated. Internal fault.
class AssemblyError : public MeetscribeError {
    using MeetscribeError::MeetscribeError;
};

class CancelledError : public MeetscribeError {
    using MeetscribeError::MeetscribeError;
};

enum class ErrorKind {
    Decode,
    UnsupportedLanguage,
    RemoteUnavailable,
    RemoteTimeout,
    RemoteRejected,
    Assembly,
    Cancelled,
    Internal,
};

/// Classify an exception for diagnostics. Unknown types map to Internal.
ErrorKind error_kind(const std::exception& e);

/// Same, for a captured exception_ptr (null maps to Internal).
ErrorKind error_kind(std::exception_ptr ep);

/// Stable lowercase name, e.g. "remote_rejected".
const char* error_kind_name(ErrorKind kind);

// ---------------------------------------------------------------------------
// Stop token: shared between the caller and chunk workers of one job
// ---------------------------------------------------------------------------

struct StopToken {
    std::atomic<bool> requested{false};

    void request() { requested.store(true, std::memory_order_release); }
    bool stop_requested() const { return requested.load(std::memory_order_acquire); }
    void reset() { requested.store(false, std::memory_order_release); }
};

// ---------------------------------------------------------------------------
// Audio constants (format required by the recognition service)
// ---------------------------------------------------------------------------

constexpr int SAMPLE_RATE = 16000;
constexpr int CHANNELS = 1;

// ---------------------------------------------------------------------------
// Path helpers (XDG-compliant)
// ---------------------------------------------------------------------------

/// ~/.config/meetscribe/
fs::path config_dir();

/// ~/.local/share/meetscribe/
fs::path data_dir();

/// Standard base64 (RFC 4648) with '=' padding.
std::string base64_encode(const std::string& data);

} // namespace meetscribe
