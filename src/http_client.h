// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"

#include <map>
#include <string>

namespace meetscribe {

using HttpHeaders = std::map<std::string, std::string>;

/// Failed HTTP exchange. status is 0 when no response was received.
class HttpError : public MeetscribeError {
public:
    HttpError(const std::string& what, long status, bool timed_out = false,
              std::string body = {})
        : MeetscribeError(what), status_(status), timed_out_(timed_out),
          body_(std::move(body)) {}

    long status() const { return status_; }
    bool timed_out() const { return timed_out_; }
    bool transport_failure() const { return status_ == 0; }
    const std::string& body() const { return body_; }

private:
    long status_;
    bool timed_out_;
    std::string body_;
};

/// HTTP GET. Returns the response body. Throws HttpError on failure or status >= 400.
std::string http_get(const std::string& url, const HttpHeaders& headers = {},
                     long timeout_seconds = 30);

/// HTTP POST JSON. Returns the response body. Throws HttpError on failure or status >= 400.
std::string http_post_json(const std::string& url,
                           const std::string& json_body,
                           const HttpHeaders& headers = {},
                           long timeout_seconds = 120);

} // namespace meetscribe
