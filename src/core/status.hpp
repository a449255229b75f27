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


// Warden Status - Header
// Error taxonomy and the value-less operation result shared by all modules

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace warden::core {

/// Failure category (drives boundary mapping and log level)
enum class ErrorKind : uint8_t {
    None,
    Authentication,  // Missing/invalid/expired credential
    Authorization,   // No principal, insufficient permission
    Validation,      // Malformed input, oversized config, disallowed pattern
    SsrfBlocked,     // Disallowed scheme/host/IP
    RateLimited,     // Backpressure
    CircuitOpen,     // Backpressure
    Timeout,         // Deadline exceeded or cancelled
    AuditDelivery,   // Never fatal
    Internal
};

/// Result of an operation that produces no value
struct Status {
    bool ok = true;
    ErrorKind kind = ErrorKind::None;
    std::string error;

    [[nodiscard]] static Status success() { return {}; }

    [[nodiscard]] static Status failure(ErrorKind kind, std::string error) {
        return {false, kind, std::move(error)};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Authentication:
            return "authentication";
        case ErrorKind::Authorization:
            return "authorization";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::SsrfBlocked:
            return "ssrf_blocked";
        case ErrorKind::RateLimited:
            return "rate_limited";
        case ErrorKind::CircuitOpen:
            return "circuit_open";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::AuditDelivery:
            return "audit_delivery";
        case ErrorKind::Internal:
            return "internal";
    }
    return "unknown";
}

}  // namespace warden::core
