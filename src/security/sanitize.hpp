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


// Warden Error Sanitization - Header
// Client-safe error shaping and secret masking

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../core/status.hpp"

namespace warden::security {

/// Stable error codes exposed to clients
enum class ErrorCode {
    Internal,
    InvalidInput,
    NotFound,
    Unauthorized,
    Forbidden,
    RateLimit,
    Timeout,
    ToolNotFound,
    ToolExecution,
    Validation
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

/// Error body safe to return to a client
struct SecureError {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
    std::map<std::string, std::string> details;  // Only populated in debug mode

    /// "CODE: message"
    [[nodiscard]] std::string what() const;
};

void to_json(nlohmann::json& j, const SecureError& e);

/// Generic internal error; debug mode adds the sanitized cause under details["error"]
[[nodiscard]] SecureError sanitize_error(std::string_view error, bool debug_mode);

/// Error with an explicit code and client message
[[nodiscard]] SecureError sanitize_error_with_code(std::string_view error, ErrorCode code,
                                                   std::string message, bool debug_mode);

/// Map a failed Status to a client error (auth failures collapse to generic text)
[[nodiscard]] SecureError to_secure_error(const core::Status& status, bool debug_mode);

/// Boundary outcome for a failure kind: "unauthorized", "forbidden", "rate_limited", ...
[[nodiscard]] std::string_view to_client_outcome(core::ErrorKind kind) noexcept;

[[nodiscard]] ErrorCode error_code_for(core::ErrorKind kind) noexcept;

/// Strip file paths, IPv4 addresses, credential-like tokens and stack traces
[[nodiscard]] std::string sanitize_error_message(std::string_view message);

/// Strip only credential-like tokens (server-side logs)
[[nodiscard]] std::string sanitize_log_message(std::string_view message);

/// "abcd****wxyz"; "****" for 8 characters or fewer; "" for empty
[[nodiscard]] std::string mask_secret(std::string_view secret);

/// Heuristic API key shape check (known prefix, or a long opaque token)
[[nodiscard]] bool is_valid_api_key_format(std::string_view key);

}  // namespace warden::security
