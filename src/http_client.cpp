// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "http_client.h"
#include "version.h"

#include <curl/curl.h>
#include <string>

namespace meetscribe {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* buf = static_cast<std::string*>(userp);
    buf->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlInit {
    CurlInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlInit() { curl_global_cleanup(); }
};

// Function-local static: initialized once, thread-safe, before any worker uses curl.
CurlInit& ensure_curl() {
    static CurlInit init;
    return init;
}

// Common curl setup: init handle, set URL, write callback, user agent, follow redirects.
// Returns the CURL handle. Caller owns it and must call curl_easy_cleanup().
CURL* curl_setup(const std::string& url, std::string& response, long timeout) {
    ensure_curl();

    CURL* curl = curl_easy_init();
    if (!curl) throw HttpError("curl_easy_init failed", 0);

    static const std::string ua = std::string("meetscribe/") + MEETSCRIBE_VERSION;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, ua.c_str());
    // Worker threads: no signal-based DNS timeouts
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    return curl;
}

struct curl_slist* build_headers(const HttpHeaders& headers, bool json) {
    struct curl_slist* hdr_list = nullptr;
    if (json)
        hdr_list = curl_slist_append(hdr_list, "Content-Type: application/json");
    for (const auto& [key, val] : headers)
        hdr_list = curl_slist_append(hdr_list, (key + ": " + val).c_str());
    return hdr_list;
}

// Perform request, check result, cleanup handle. Returns HTTP status code.
long curl_perform(CURL* curl, const std::string& method, const std::string& url,
                  struct curl_slist* hdr_list = nullptr) {
    CURLcode res = curl_easy_perform(curl);
    if (hdr_list) curl_slist_free_all(hdr_list);

    if (res != CURLE_OK) {
        std::string err = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw HttpError("HTTP " + method + " failed: " + err + " (" + url + ")", 0,
                        res == CURLE_OPERATION_TIMEDOUT);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);
    return http_code;
}

} // anonymous namespace

std::string http_get(const std::string& url, const HttpHeaders& headers,
                     long timeout_seconds) {
    std::string response;
    CURL* curl = curl_setup(url, response, timeout_seconds);

    struct curl_slist* hdr_list = build_headers(headers, false);
    if (hdr_list)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdr_list);

    long code = curl_perform(curl, "GET", url, hdr_list);
    if (code >= 400)
        throw HttpError("HTTP GET " + std::to_string(code) + ": " + url, code, false, response);

    return response;
}

std::string http_post_json(const std::string& url,
                           const std::string& json_body,
                           const HttpHeaders& headers,
                           long timeout_seconds) {
    std::string response;
    CURL* curl = curl_setup(url, response, timeout_seconds);

    struct curl_slist* hdr_list = build_headers(headers, true);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdr_list);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));

    long code = curl_perform(curl, "POST", url, hdr_list);
    if (code >= 400)
        throw HttpError("HTTP POST " + std::to_string(code) + ": " + url, code, false, response);

    return response;
}

} // namespace meetscribe
