// Error Sanitization Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include <nlohmann/json.hpp>

#include "core/status.hpp"
#include "security/sanitize.hpp"

using namespace warden;
using namespace warden::security;

TEST_CASE("Error messages are scrubbed", "[security][sanitize]") {
    SECTION("File paths") {
        REQUIRE(sanitize_error_message("failed to open /home/alice/secrets.txt") ==
                "failed to open [PATH]/alice/secrets.txt");
        REQUIRE(sanitize_error_message("missing /Users/bob/config") ==
                "missing [PATH]/bob/config");
        REQUIRE(sanitize_error_message("cannot read C:\\keys\\prod.pem") ==
                "cannot read [PATH]\\keys\\prod.pem");
    }

    SECTION("IP addresses") {
        REQUIRE(sanitize_error_message("dial tcp 10.0.0.5:9200: connection refused") ==
                "dial tcp [IP_ADDRESS] connection refused");
        REQUIRE(sanitize_error_message("peer 192.168.1.20, retrying") ==
                "peer [IP_ADDRESS] retrying");
        REQUIRE(sanitize_error_message("version 1.2.3 released") == "version 1.2.3 released");
    }

    SECTION("Secrets") {
        std::string key = "sk-" + std::string(32, 'a');
        REQUIRE(sanitize_error_message("auth failed for " + key) == "auth failed for [REDACTED]");
        REQUIRE(sanitize_error_message("header Bearer abc") == "header [REDACTED]");
    }

    SECTION("Stack traces") {
        REQUIRE(sanitize_error_message("error at main.cpp:42") == "error at [FILE:LINE]");
        REQUIRE(sanitize_error_message("bad pointer 0xdeadbeef") == "bad pointer [ADDR]");
        REQUIRE(sanitize_error_message("panic: runtime error: index out of range") ==
                "panic: [DETAILS_REMOVED]");
    }

    SECTION("Log messages only lose credentials") {
        std::string token = "token=" + std::string(20, 'x');
        REQUIRE(sanitize_log_message("/home/svc " + token) == "/home/svc [REDACTED]");
    }
}

TEST_CASE("Client-facing errors", "[security][sanitize]") {
    SECTION("Generic internal error") {
        auto error = sanitize_error("db at 10.1.1.1 failed", false);
        REQUIRE(error.code == ErrorCode::Internal);
        REQUIRE(error.message == "An internal error occurred");
        REQUIRE(error.details.empty());

        nlohmann::json j = error;
        REQUIRE(j["code"] == "INTERNAL_ERROR");
        REQUIRE_FALSE(j.contains("details"));
    }

    SECTION("Debug mode exposes scrubbed details") {
        auto error = sanitize_error("db at 10.1.1.1 failed", true);
        REQUIRE(error.details["error"] == "db at [IP_ADDRESS] failed");

        nlohmann::json j = error;
        REQUIRE(j["details"]["error"] == "db at [IP_ADDRESS] failed");
    }

    SECTION("Explicit code") {
        auto error = sanitize_error_with_code("no such tool", ErrorCode::ToolNotFound,
                                              "Tool not found", false);
        REQUIRE(error.what() == "TOOL_NOT_FOUND: Tool not found");
    }

    SECTION("Status mapping") {
        auto auth = to_secure_error(
            core::Status::failure(core::ErrorKind::Authentication, "invalid API key abc"), true);
        REQUIRE(auth.code == ErrorCode::Unauthorized);
        REQUIRE(auth.message == "Unauthorized");
        // Authentication details never reach the client
        REQUIRE(auth.details.empty());

        auto limited = to_secure_error(
            core::Status::failure(core::ErrorKind::RateLimited, "client rate limit"), true);
        REQUIRE(limited.code == ErrorCode::RateLimit);
        REQUIRE(limited.details["error"] == "client rate limit");

        auto ssrf = to_secure_error(
            core::Status::failure(core::ErrorKind::SsrfBlocked, "private IP addresses not allowed"),
            false);
        REQUIRE(ssrf.code == ErrorCode::Validation);
        REQUIRE(ssrf.message == "Invalid request");

        auto internal = to_secure_error(
            core::Status::failure(core::ErrorKind::AuditDelivery, "siem down"), false);
        REQUIRE(internal.message == "An internal error occurred");
    }

    SECTION("Outcome names") {
        REQUIRE(to_client_outcome(core::ErrorKind::Authorization) == "forbidden");
        REQUIRE(to_client_outcome(core::ErrorKind::CircuitOpen) == "unavailable");
        REQUIRE(to_client_outcome(core::ErrorKind::Timeout) == "timeout");
        REQUIRE(to_client_outcome(core::ErrorKind::None) == "ok");
        REQUIRE(error_code_for(core::ErrorKind::CircuitOpen) == ErrorCode::RateLimit);
        REQUIRE(to_string(ErrorCode::ToolExecution) == "TOOL_EXECUTION_ERROR");
    }
}

TEST_CASE("Secret helpers", "[security][sanitize]") {
    SECTION("Masking") {
        REQUIRE(mask_secret("").empty());
        REQUIRE(mask_secret("short") == "****");
        REQUIRE(mask_secret("sk-1234567890abcdef") == "sk-1****cdef");
    }

    SECTION("API key shape") {
        REQUIRE(is_valid_api_key_format("sk-0123456789abcd"));
        REQUIRE(is_valid_api_key_format(std::string(32, 'z')));
        REQUIRE_FALSE(is_valid_api_key_format("abcdefghijklmnop"));
        REQUIRE_FALSE(is_valid_api_key_format("sk-short"));
    }
}
