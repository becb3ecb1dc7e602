// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include "util.h"

using namespace meetscribe;

TEST_CASE("StopToken: default state is not requested", "[util]") {
    StopToken token;
    CHECK_FALSE(token.stop_requested());
}

TEST_CASE("StopToken: request sets flag", "[util]") {
    StopToken token;
    token.request();
    CHECK(token.stop_requested());
}

TEST_CASE("StopToken: reset clears flag", "[util]") {
    StopToken token;
    token.request();
    REQUIRE(token.stop_requested());
    token.reset();
    CHECK_FALSE(token.stop_requested());
}

TEST_CASE("config_dir: returns path ending in meetscribe", "[util]") {
    auto dir = config_dir();
    CHECK(dir.filename() == "meetscribe");
    CHECK(dir.string().find("config") != std::string::npos);
}

TEST_CASE("data_dir: returns path ending in meetscribe", "[util]") {
    CHECK(data_dir().filename() == "meetscribe");
}

TEST_CASE("base64_encode: RFC 4648 test vectors", "[util]") {
    CHECK(base64_encode("") == "");
    CHECK(base64_encode("f") == "Zg==");
    CHECK(base64_encode("fo") == "Zm8=");
    CHECK(base64_encode("foo") == "Zm9v");
    CHECK(base64_encode("foob") == "Zm9vYg==");
    CHECK(base64_encode("fooba") == "Zm9vYmE=");
    CHECK(base64_encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64_encode: binary bytes", "[util]") {
    std::string bytes("\x00\xff\x10", 3);
    CHECK(base64_encode(bytes) == "AP8Q");
}

// ---------------------------------------------------------------------------
// Error classification
// ---------------------------------------------------------------------------

TEST_CASE("error_kind: each exception type maps to its kind", "[util]") {
    CHECK(error_kind(DecodeError("x")) == ErrorKind::Decode);
    CHECK(error_kind(UnsupportedLanguageError("x")) == ErrorKind::UnsupportedLanguage);
    CHECK(error_kind(RemoteUnavailable("x")) == ErrorKind::RemoteUnavailable);
    CHECK(error_kind(RemoteTimeout("x")) == ErrorKind::RemoteTimeout);
    CHECK(error_kind(RemoteRejected("x")) == ErrorKind::RemoteRejected);
    CHECK(error_kind(AssemblyError("x")) == ErrorKind::Assembly);
    CHECK(error_kind(CancelledError("x")) == ErrorKind::Cancelled);
}

TEST_CASE("error_kind: unknown exceptions are internal", "[util]") {
    CHECK(error_kind(MeetscribeError("x")) == ErrorKind::Internal);
    CHECK(error_kind(std::runtime_error("x")) == ErrorKind::Internal);
    CHECK(error_kind(std::exception_ptr{}) == ErrorKind::Internal);
}

TEST_CASE("error_kind: captured exception_ptr", "[util]") {
    std::exception_ptr ep;
    try {
        throw RemoteRejected("bad codec");
    } catch (...) {
        ep = std::current_exception();
    }
    CHECK(error_kind(ep) == ErrorKind::RemoteRejected);
}

TEST_CASE("error_kind_name: stable names", "[util]") {
    CHECK(std::string(error_kind_name(ErrorKind::Decode)) == "decode");
    CHECK(std::string(error_kind_name(ErrorKind::RemoteTimeout)) == "remote_timeout");
    CHECK(std::string(error_kind_name(ErrorKind::RemoteRejected)) == "remote_rejected");
    CHECK(std::string(error_kind_name(ErrorKind::Internal)) == "internal");
}
