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


// Warden Audit Event - Header
// Structured audit record and its JSON wire format

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::audit {

/// Event type names
namespace event_type {
inline constexpr std::string_view kToolCall = "tool.call";
inline constexpr std::string_view kToolResult = "tool.result";
inline constexpr std::string_view kAuthSuccess = "auth.success";
inline constexpr std::string_view kAuthFailure = "auth.failure";
inline constexpr std::string_view kAuthzAllowed = "authz.allowed";
inline constexpr std::string_view kAuthzDenied = "authz.denied";
inline constexpr std::string_view kRateLimit = "ratelimit.exceeded";
inline constexpr std::string_view kValidation = "validation.error";
inline constexpr std::string_view kError = "error";

// Legacy convenience events
inline constexpr std::string_view kToolExecution = "tool.execution";
inline constexpr std::string_view kAuthAttempt = "auth.attempt";
inline constexpr std::string_view kAuthorization = "auth.authorization";
}  // namespace event_type

struct PrincipalInfo {
    std::string id;
    std::string type;
    std::vector<std::string> roles;
};

struct ClientInfo {
    std::string ip_address;
    std::string user_agent;
};

/// One audit record. Written once to every backend; never modified after.
struct StructuredAuditEvent {
    std::string id;
    std::chrono::system_clock::time_point timestamp{};
    std::string type;
    std::string request_id;
    std::string trace_id;
    std::string span_id;
    std::optional<PrincipalInfo> principal;
    std::string resource;
    std::string action;
    std::string result;
    std::string error;
    int64_t duration_ns = 0;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<ClientInfo> client_info;
};

/// RFC 3339 UTC timestamp with up to nanosecond precision, trailing zeros
/// trimmed (2025-01-02T03:04:05.5Z)
[[nodiscard]] std::string format_rfc3339_nano(std::chrono::system_clock::time_point tp);

/// Parse an RFC 3339 timestamp (Z or numeric offset, optional fraction)
[[nodiscard]] std::optional<std::chrono::system_clock::time_point> parse_rfc3339_nano(
    std::string_view text);

void to_json(nlohmann::json& j, const PrincipalInfo& p);
void from_json(const nlohmann::json& j, PrincipalInfo& p);
void to_json(nlohmann::json& j, const ClientInfo& c);
void from_json(const nlohmann::json& j, ClientInfo& c);

/// Empty optional fields are omitted
void to_json(nlohmann::json& j, const StructuredAuditEvent& e);
void from_json(const nlohmann::json& j, StructuredAuditEvent& e);

}  // namespace warden::audit
