// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "util.h"

#include <cstdint>
#include <cstdlib>

namespace meetscribe {

ErrorKind error_kind(const std::exception& e) {
    // Most derived first
    if (dynamic_cast<const DecodeError*>(&e)) return ErrorKind::Decode;
    if (dynamic_cast<const UnsupportedLanguageError*>(&e)) return ErrorKind::UnsupportedLanguage;
    if (dynamic_cast<const RemoteUnavailable*>(&e)) return ErrorKind::RemoteUnavailable;
    if (dynamic_cast<const RemoteTimeout*>(&e)) return ErrorKind::RemoteTimeout;
    if (dynamic_cast<const RemoteRejected*>(&e)) return ErrorKind::RemoteRejected;
    if (dynamic_cast<const AssemblyError*>(&e)) return ErrorKind::Assembly;
    if (dynamic_cast<const CancelledError*>(&e)) return ErrorKind::Cancelled;
    return ErrorKind::Internal;
}

ErrorKind error_kind(std::exception_ptr ep) {
    if (!ep) return ErrorKind::Internal;
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return error_kind(e);
    } catch (...) {
        return ErrorKind::Internal;
    }
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Decode:              return "decode";
        case ErrorKind::UnsupportedLanguage: return "unsupported_language";
        case ErrorKind::RemoteUnavailable:   return "remote_unavailable";
        case ErrorKind::RemoteTimeout:       return "remote_timeout";
        case ErrorKind::RemoteRejected:      return "remote_rejected";
        case ErrorKind::Assembly:            return "assembly";
        case ErrorKind::Cancelled:           return "cancelled";
        default:                             return "internal";
    }
}

static fs::path xdg_dir(const char* env_var, const char* fallback_suffix) {
    if (const char* val = std::getenv(env_var); val && val[0] != '\0')
        return fs::path(val) / "meetscribe";
    if (const char* home = std::getenv("HOME"))
        return fs::path(home) / fallback_suffix / "meetscribe";
    return fs::path(".") / fallback_suffix / "meetscribe";
}

fs::path config_dir() { return xdg_dir("XDG_CONFIG_HOME", ".config"); }
fs::path data_dir()   { return xdg_dir("XDG_DATA_HOME", ".local/share"); }

std::string base64_encode(const std::string& data) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(data[i]) << 16) |
                     (static_cast<uint8_t>(data[i + 1]) << 8) |
                     static_cast<uint8_t>(data[i + 2]);
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += table[(n >> 6) & 0x3F];
        out += table[n & 0x3F];
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(data[i]) << 16;
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(data[i]) << 16) |
                     (static_cast<uint8_t>(data[i + 1]) << 8);
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += table[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace meetscribe
