/*
 * Copyright 2025 Warden Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


// Warden Error Sanitization - Implementation

#include "sanitize.hpp"

#include <algorithm>
#include <array>
#include <vector>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../http/regex.hpp"

namespace warden::security {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Internal:
            return "INTERNAL_ERROR";
        case ErrorCode::InvalidInput:
            return "INVALID_INPUT";
        case ErrorCode::NotFound:
            return "NOT_FOUND";
        case ErrorCode::Unauthorized:
            return "UNAUTHORIZED";
        case ErrorCode::Forbidden:
            return "FORBIDDEN";
        case ErrorCode::RateLimit:
            return "RATE_LIMIT";
        case ErrorCode::Timeout:
            return "TIMEOUT";
        case ErrorCode::ToolNotFound:
            return "TOOL_NOT_FOUND";
        case ErrorCode::ToolExecution:
            return "TOOL_EXECUTION_ERROR";
        case ErrorCode::Validation:
            return "VALIDATION_ERROR";
    }
    return "INTERNAL_ERROR";
}

std::string SecureError::what() const {
    return std::string(to_string(code)) + ": " + message;
}

void to_json(nlohmann::json& j, const SecureError& e) {
    j = nlohmann::json{{"code", to_string(e.code)}, {"message", e.message}};
    if (!e.details.empty()) {
        j["details"] = e.details;
    }
}

// ============================================================================
// Message scrubbing
// ============================================================================

namespace {

void replace_all(std::string& s, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string remove_file_paths(std::string msg) {
    replace_all(msg, "/Users/", "/home/");
    for (std::string_view prefix : {"/home/", "/var/", "/etc/", "/opt/", "/tmp/"}) {
        replace_all(msg, prefix, "[PATH]/");
    }
    for (std::string_view drive : {"C:\\", "D:\\", "E:\\", "F:\\"}) {
        replace_all(msg, drive, "[PATH]\\");
    }
    return msg;
}

bool looks_like_ipv4(std::string_view token) {
    // Allow trailing punctuation and an optional :port
    while (!token.empty() && (token.back() == ',' || token.back() == ';' || token.back() == ')')) {
        token.remove_suffix(1);
    }
    auto octets = core::split(token.substr(0, token.find(':')), '.');
    if (octets.size() != 4) {
        return false;
    }
    for (const auto& octet : octets) {
        if (octet.empty() || octet.size() > 3) {
            return false;
        }
        for (char c : octet) {
            if (c < '0' || c > '9') {
                return false;
            }
        }
    }
    return true;
}

std::string remove_ip_addresses(std::string_view msg) {
    std::string out;
    out.reserve(msg.size());

    size_t i = 0;
    while (i < msg.size()) {
        size_t end = msg.find_first_of(" \t\n", i);
        if (end == std::string_view::npos) {
            end = msg.size();
        }
        std::string_view token = msg.substr(i, end - i);
        out.append(looks_like_ipv4(token) ? std::string_view("[IP_ADDRESS]") : token);
        if (end < msg.size()) {
            out.push_back(msg[end]);
        }
        i = end + 1;
    }
    return out;
}

struct SecretPattern {
    std::string_view prefix;
    size_t length;
};

constexpr std::array<SecretPattern, 6> kSecretPatterns{{
    {"sk-", 32},
    {"xai-", 32},
    {"api_key=", 20},
    {"apiKey=", 20},
    {"token=", 20},
    {"Bearer ", 20},
}};

std::string remove_secret_patterns(std::string msg) {
    for (const auto& pattern : kSecretPatterns) {
        size_t pos = 0;
        while ((pos = msg.find(pattern.prefix, pos)) != std::string::npos) {
            size_t end = std::min(msg.size(), pos + pattern.prefix.size() + pattern.length);
            msg.replace(pos, end - pos, "[REDACTED]");
            pos += 10;  // strlen("[REDACTED]")
        }
    }
    return msg;
}

struct Scrubber {
    http::Regex trace_block;
    http::Regex file_line;
    http::Regex address;
    http::Regex panic;
};

const Scrubber* stack_scrubber() {
    static const auto scrubber = []() -> std::optional<Scrubber> {
        auto trace_block = http::Regex::compile(
            R"((?:goroutine \d+ \[[^\]]+\]:|stack trace:|Stack trace:)[\s\S]*?(?:\n\n|\z))");
        auto file_line = http::Regex::compile(R"(\S+\.(?:go|c|cc|cpp|h|hpp|py|rs|java):\d+)");
        auto address = http::Regex::compile(R"(0x[0-9a-fA-F]+)");
        auto panic = http::Regex::compile(R"((?:panic|terminate called).*)");
        if (!trace_block || !file_line || !address || !panic) {
            return std::nullopt;
        }
        return Scrubber{std::move(*trace_block), std::move(*file_line), std::move(*address),
                        std::move(*panic)};
    }();
    return scrubber ? &*scrubber : nullptr;
}

std::string remove_stack_traces(std::string msg) {
    const Scrubber* s = stack_scrubber();
    if (!s) {
        return msg;
    }
    msg = s->trace_block.replace_all(msg, "[STACK_TRACE_REMOVED]");
    msg = s->file_line.replace_all(msg, "[FILE:LINE]");
    msg = s->address.replace_all(msg, "[ADDR]");
    msg = s->panic.replace_all(msg, "panic: [DETAILS_REMOVED]");
    return msg;
}

}  // namespace

std::string sanitize_error_message(std::string_view message) {
    std::string msg = remove_file_paths(std::string(message));
    msg = remove_ip_addresses(msg);
    msg = remove_secret_patterns(std::move(msg));
    return remove_stack_traces(std::move(msg));
}

std::string sanitize_log_message(std::string_view message) {
    return remove_secret_patterns(std::string(message));
}

// ============================================================================
// Client errors
// ============================================================================

SecureError sanitize_error(std::string_view error, bool debug_mode) {
    WARDEN_LOG_ERROR("Internal error: {}", sanitize_log_message(error));

    SecureError secure;
    secure.code = ErrorCode::Internal;
    secure.message = "An internal error occurred";
    if (debug_mode) {
        secure.details["error"] = sanitize_error_message(error);
    }
    return secure;
}

SecureError sanitize_error_with_code(std::string_view error, ErrorCode code, std::string message,
                                     bool debug_mode) {
    WARDEN_LOG_ERROR("Error [{}]: {}", to_string(code), sanitize_log_message(error));

    SecureError secure;
    secure.code = code;
    secure.message = std::move(message);
    if (debug_mode) {
        secure.details["error"] = sanitize_error_message(error);
    }
    return secure;
}

ErrorCode error_code_for(core::ErrorKind kind) noexcept {
    switch (kind) {
        case core::ErrorKind::Authentication:
            return ErrorCode::Unauthorized;
        case core::ErrorKind::Authorization:
            return ErrorCode::Forbidden;
        case core::ErrorKind::Validation:
        case core::ErrorKind::SsrfBlocked:
            return ErrorCode::Validation;
        case core::ErrorKind::RateLimited:
        case core::ErrorKind::CircuitOpen:
            return ErrorCode::RateLimit;
        case core::ErrorKind::Timeout:
            return ErrorCode::Timeout;
        case core::ErrorKind::None:
        case core::ErrorKind::AuditDelivery:
        case core::ErrorKind::Internal:
            return ErrorCode::Internal;
    }
    return ErrorCode::Internal;
}

std::string_view to_client_outcome(core::ErrorKind kind) noexcept {
    switch (kind) {
        case core::ErrorKind::Authentication:
            return "unauthorized";
        case core::ErrorKind::Authorization:
            return "forbidden";
        case core::ErrorKind::Validation:
        case core::ErrorKind::SsrfBlocked:
            return "invalid_request";
        case core::ErrorKind::RateLimited:
            return "rate_limited";
        case core::ErrorKind::CircuitOpen:
            return "unavailable";
        case core::ErrorKind::Timeout:
            return "timeout";
        case core::ErrorKind::None:
            return "ok";
        case core::ErrorKind::AuditDelivery:
        case core::ErrorKind::Internal:
            return "internal_error";
    }
    return "internal_error";
}

SecureError to_secure_error(const core::Status& status, bool debug_mode) {
    ErrorCode code = error_code_for(status.kind);
    switch (status.kind) {
        case core::ErrorKind::Authentication:
            return sanitize_error_with_code(status.error, code, "Unauthorized", false);
        case core::ErrorKind::Authorization:
            return sanitize_error_with_code(status.error, code, "Forbidden", false);
        case core::ErrorKind::RateLimited:
        case core::ErrorKind::CircuitOpen:
            return sanitize_error_with_code(status.error, code, "Too many requests", debug_mode);
        case core::ErrorKind::Timeout:
            return sanitize_error_with_code(status.error, code, "Request timed out", debug_mode);
        case core::ErrorKind::Validation:
        case core::ErrorKind::SsrfBlocked:
            return sanitize_error_with_code(status.error, code, "Invalid request", debug_mode);
        default:
            return sanitize_error(status.error, debug_mode);
    }
}

// ============================================================================
// Secrets
// ============================================================================

std::string mask_secret(std::string_view secret) {
    if (secret.empty()) {
        return "";
    }
    if (secret.size() <= 8) {
        return "****";
    }
    return std::string(secret.substr(0, 4)) + "****" + std::string(secret.substr(secret.size() - 4));
}

bool is_valid_api_key_format(std::string_view key) {
    if (key.size() < 16) {
        return false;
    }

    for (std::string_view prefix : {"sk-", "xai-", "hf_", "pk-", "Bearer "}) {
        if (key.substr(0, prefix.size()) == prefix) {
            return true;
        }
    }

    return key.size() >= 32;
}

}  // namespace warden::security
