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


// Warden Audit Logger - Header
// Builds structured audit events and fans them out to every backend

#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../auth/principal.hpp"
#include "../control/config.hpp"
#include "../core/request_context.hpp"
#include "../core/status.hpp"
#include "audit_backend.hpp"
#include "audit_event.hpp"

namespace warden::audit {

/// Flat audit record produced by the legacy convenience builders
struct AuditRecord {
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::string event_type;
    std::string user_id;
    std::string session_id;
    std::string ip_address;
    std::string user_agent;
    std::string resource;
    std::string action;
    std::string result;
    std::string error;
    nlohmann::json metadata = nlohmann::json::object();
};

/// Fans audit events out to its backends.
///
/// Backend write failures never reach the caller: each one is printed to
/// stderr as an AUDIT_FALLBACK line and logged as an error.
class AuditLogger {
public:
    AuditLogger() = default;
    explicit AuditLogger(std::vector<std::unique_ptr<AuditBackend>> backends);

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    void add_backend(std::unique_ptr<AuditBackend> backend);

    [[nodiscard]] size_t backend_count() const;

    /// Fill id/timestamp if unset, enrich from `ctx`, write everywhere
    void log(const core::RequestContext& ctx, StructuredAuditEvent event);

    /// Legacy flat record (no context enrichment)
    void log(const AuditRecord& record);

    /// tool.result on success, error on failure. Argument values are never
    /// recorded, only args_count and the sorted args_keys.
    void log_tool_execution(const core::RequestContext& ctx, std::string_view tool,
                            const nlohmann::json& args, const core::Status& outcome);

    void log_auth_attempt(const core::RequestContext& ctx, bool success,
                          std::string_view error = {});

    void log_authorization_check(const core::RequestContext& ctx, std::string_view resource,
                                 auth::Permission permission, bool allowed);

    void log_rate_limit_exceeded(const core::RequestContext& ctx, std::string_view resource,
                                 std::string_view client_id);

    void log_validation_error(const core::RequestContext& ctx, std::string_view resource,
                              std::string_view error);

    /// Close every backend; returns the last failure
    [[nodiscard]] core::Status close();

    /// Write to every backend as-is (no enrichment)
    void write(const StructuredAuditEvent& event);

private:
    mutable std::shared_mutex mutex_;
    std::vector<std::unique_ptr<AuditBackend>> backends_;
};

/// Copy tracing ids, principal and client info from `ctx` onto `event`
void enrich_from_context(const core::RequestContext& ctx, StructuredAuditEvent& event);

/// {"args_count": N, "args_keys": [sorted]} for a JSON object of arguments
[[nodiscard]] nlohmann::json describe_arguments(const nlohmann::json& args);

// ============================================================================
// Legacy record builders
// ============================================================================

[[nodiscard]] AuditRecord make_tool_execution_record(const core::RequestContext& ctx,
                                                     std::string_view tool,
                                                     const nlohmann::json& args,
                                                     const core::Status& outcome);

[[nodiscard]] AuditRecord make_auth_attempt_record(bool success, std::string_view error = {});

[[nodiscard]] AuditRecord make_authorization_record(const core::RequestContext& ctx,
                                                    std::string_view resource,
                                                    auth::Permission permission, bool allowed);

/// Build a logger from the audit section.
///   disabled -> no backends
///   memory   -> MemoryAuditBackend
///   json     -> NDJSON on stdout
///   file     -> FileAuditBackend(file_path)
///   elasticsearch / splunk / webhook -> SIEM backend from audit.siem
[[nodiscard]] std::unique_ptr<AuditLogger> create_audit_logger(const control::AuditConfig& config,
                                                               core::Status& status);

}  // namespace warden::audit
