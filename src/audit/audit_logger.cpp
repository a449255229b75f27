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


// Warden Audit Logger - Implementation

#include "audit_logger.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <mutex>

#include "../core/logging.hpp"
#include "../security/sanitize.hpp"
#include "siem_backend.hpp"

namespace warden::audit {

using core::ErrorKind;
using core::Status;

namespace {

StructuredAuditEvent new_event(std::string_view type, std::string_view resource,
                               std::string_view action) {
    StructuredAuditEvent event;
    event.id = logging::generate_uuid();
    event.timestamp = std::chrono::system_clock::now();
    event.type = std::string(type);
    event.resource = std::string(resource);
    event.action = std::string(action);
    return event;
}

PrincipalInfo principal_info(const auth::Principal& principal) {
    return PrincipalInfo{principal.id, "user", principal.roles};
}

}  // namespace

// ============================================================================
// Enrichment
// ============================================================================

void enrich_from_context(const core::RequestContext& ctx, StructuredAuditEvent& event) {
    if (event.request_id.empty()) {
        event.request_id = ctx.request_id();
    }
    if (event.trace_id.empty()) {
        event.trace_id = ctx.trace_id();
    }
    if (event.span_id.empty()) {
        event.span_id = ctx.span_id();
    }

    const auth::AuthContext* auth = ctx.auth();
    if (auth == nullptr) {
        return;
    }
    if (!event.principal) {
        event.principal = principal_info(auth->principal);
    }
    if (!event.client_info && (!auth->client_ip.empty() || !auth->user_agent.empty())) {
        event.client_info = ClientInfo{auth->client_ip, auth->user_agent};
    }
}

nlohmann::json describe_arguments(const nlohmann::json& args) {
    nlohmann::json out = nlohmann::json::object();
    if (!args.is_object()) {
        return out;
    }

    std::vector<std::string> keys;
    keys.reserve(args.size());
    for (const auto& item : args.items()) {
        keys.push_back(item.key());
    }
    std::sort(keys.begin(), keys.end());

    out["args_count"] = keys.size();
    out["args_keys"] = keys;
    return out;
}

// ============================================================================
// AuditLogger
// ============================================================================

AuditLogger::AuditLogger(std::vector<std::unique_ptr<AuditBackend>> backends)
    : backends_(std::move(backends)) {}

void AuditLogger::add_backend(std::unique_ptr<AuditBackend> backend) {
    if (!backend) {
        return;
    }
    std::unique_lock lock(mutex_);
    backends_.push_back(std::move(backend));
}

size_t AuditLogger::backend_count() const {
    std::shared_lock lock(mutex_);
    return backends_.size();
}

void AuditLogger::write(const StructuredAuditEvent& event) {
    std::shared_lock lock(mutex_);
    for (const auto& backend : backends_) {
        Status status;
        try {
            status = backend->write(event);
        } catch (const std::exception& e) {
            status = Status::failure(ErrorKind::AuditDelivery, e.what());
        }
        if (status) {
            continue;
        }
        fmt::print(stderr,
                   "AUDIT_FALLBACK: failed to write audit event {} (type={}, resource={}): {}\n",
                   event.id, event.type, event.resource, status.error);
        WARDEN_LOG_ERROR("Audit write failed: backend={}, event={}, type={}, error={}",
                         backend->name(), event.id, event.type, status.error);
    }
}

void AuditLogger::log(const core::RequestContext& ctx, StructuredAuditEvent event) {
    if (event.id.empty()) {
        event.id = logging::generate_uuid();
    }
    if (event.timestamp == std::chrono::system_clock::time_point{}) {
        event.timestamp = std::chrono::system_clock::now();
    }
    enrich_from_context(ctx, event);
    write(event);
}

void AuditLogger::log(const AuditRecord& record) {
    StructuredAuditEvent event;
    event.id = logging::generate_uuid();
    event.timestamp = record.timestamp;
    event.type = record.event_type;
    event.resource = record.resource;
    event.action = record.action;
    event.result = record.result;
    event.error = record.error;
    event.metadata = record.metadata.is_object() ? record.metadata : nlohmann::json::object();

    if (!record.user_id.empty()) {
        event.principal = PrincipalInfo{record.user_id, {}, {}};
    }
    if (!record.ip_address.empty() || !record.user_agent.empty()) {
        event.client_info = ClientInfo{record.ip_address, record.user_agent};
    }
    if (!record.session_id.empty()) {
        event.metadata["session_id"] = record.session_id;
    }

    write(event);
}

void AuditLogger::log_tool_execution(const core::RequestContext& ctx, std::string_view tool,
                                     const nlohmann::json& args, const Status& outcome) {
    auto event = new_event(outcome ? event_type::kToolResult : event_type::kError, tool, "execute");
    event.metadata = describe_arguments(args);

    if (outcome) {
        event.result = "success";
    } else {
        event.result = "failure";
        event.error = security::sanitize_error_message(outcome.error);
    }

    enrich_from_context(ctx, event);
    write(event);
}

void AuditLogger::log_auth_attempt(const core::RequestContext& ctx, bool success,
                                   std::string_view error) {
    auto event = new_event(success ? event_type::kAuthSuccess : event_type::kAuthFailure,
                           "authentication", "authenticate");
    if (success) {
        event.result = "success";
    } else {
        event.result = "failure";
        if (!error.empty()) {
            event.error = security::sanitize_error_message(error);
        }
    }

    enrich_from_context(ctx, event);
    write(event);
}

void AuditLogger::log_authorization_check(const core::RequestContext& ctx,
                                          std::string_view resource, auth::Permission permission,
                                          bool allowed) {
    auto event = new_event(allowed ? event_type::kAuthzAllowed : event_type::kAuthzDenied, resource,
                           auth::to_string(permission));
    event.result = allowed ? "allowed" : "denied";

    enrich_from_context(ctx, event);
    write(event);
}

void AuditLogger::log_rate_limit_exceeded(const core::RequestContext& ctx,
                                          std::string_view resource, std::string_view client_id) {
    auto event = new_event(event_type::kRateLimit, resource, "rate_limit");
    event.result = "exceeded";
    event.metadata["client_id"] = std::string(client_id);

    enrich_from_context(ctx, event);
    write(event);
}

void AuditLogger::log_validation_error(const core::RequestContext& ctx, std::string_view resource,
                                       std::string_view error) {
    auto event = new_event(event_type::kValidation, resource, "validate");
    event.result = "failure";
    event.error = security::sanitize_error_message(error);

    enrich_from_context(ctx, event);
    write(event);
}

Status AuditLogger::close() {
    std::shared_lock lock(mutex_);
    Status last = Status::success();
    for (const auto& backend : backends_) {
        if (auto status = backend->close(); !status) {
            WARDEN_LOG_WARNING("Audit backend {} close failed: {}", backend->name(), status.error);
            last = std::move(status);
        }
    }
    return last;
}

// ============================================================================
// Legacy builders
// ============================================================================

AuditRecord make_tool_execution_record(const core::RequestContext& ctx, std::string_view tool,
                                       const nlohmann::json& args, const Status& outcome) {
    AuditRecord record;
    record.event_type = std::string(event_type::kToolExecution);
    record.resource = std::string(tool);
    record.action = "execute";

    if (const auth::AuthContext* auth = ctx.auth()) {
        record.user_id = auth->principal.id;
        record.session_id = auth->session_id;
        record.ip_address = auth->client_ip;
        record.user_agent = auth->user_agent;
    }
    if (args.is_object()) {
        record.metadata["args_count"] = args.size();
    }

    if (outcome) {
        record.result = "success";
    } else {
        record.result = "failure";
        record.error = security::sanitize_error_message(outcome.error);
    }
    return record;
}

AuditRecord make_auth_attempt_record(bool success, std::string_view error) {
    AuditRecord record;
    record.event_type = std::string(event_type::kAuthAttempt);
    record.resource = "system";
    record.action = "authenticate";
    record.result = success ? "success" : "failure";
    if (!success && !error.empty()) {
        record.error = security::sanitize_error_message(error);
    }
    return record;
}

AuditRecord make_authorization_record(const core::RequestContext& ctx, std::string_view resource,
                                      auth::Permission permission, bool allowed) {
    AuditRecord record;
    record.event_type = std::string(event_type::kAuthorization);
    record.resource = std::string(resource);
    record.action = std::string(auth::to_string(permission));
    record.result = allowed ? "allowed" : "denied";

    if (const auth::AuthContext* auth = ctx.auth()) {
        record.user_id = auth->principal.id;
        record.session_id = auth->session_id;
    }
    return record;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<AuditLogger> create_audit_logger(const control::AuditConfig& config,
                                                 Status& status) {
    status = Status::success();
    auto logger = std::make_unique<AuditLogger>();
    if (!config.enabled) {
        WARDEN_LOG_INFO("Audit logging disabled");
        return logger;
    }

    const std::string& backend = config.backend;
    if (backend == "memory") {
        logger->add_backend(std::make_unique<MemoryAuditBackend>());
    } else if (backend == "json") {
        logger->add_backend(FileAuditBackend::from_fd(STDOUT_FILENO, false));
    } else if (backend == "file") {
        auto file = FileAuditBackend::open(config.file_path, status);
        if (!file) {
            return nullptr;
        }
        logger->add_backend(std::move(file));
    } else if (backend == "elasticsearch" || backend == "splunk" || backend == "webhook") {
        if (!config.siem) {
            status = Status::failure(ErrorKind::Validation,
                                     "audit backend " + backend + " requires siem configuration");
            return nullptr;
        }
        const control::SiemConfig& siem = *config.siem;
        std::unique_ptr<AuditBackend> created;

        if (backend == "elasticsearch") {
            if (!siem.elasticsearch) {
                status = Status::failure(ErrorKind::Validation,
                                         "elasticsearch configuration with at least one URL is required");
                return nullptr;
            }
            created = ElasticsearchBackend::create(*siem.elasticsearch, siem, status);
        } else if (backend == "splunk") {
            if (!siem.splunk) {
                status = Status::failure(ErrorKind::Validation,
                                         "splunk configuration with URL is required");
                return nullptr;
            }
            created = SplunkBackend::create(*siem.splunk, siem, status);
        } else {
            if (!siem.webhook) {
                status = Status::failure(ErrorKind::Validation,
                                         "webhook configuration with URL is required");
                return nullptr;
            }
            created = WebhookBackend::create(*siem.webhook, siem, status);
        }

        if (!created) {
            return nullptr;
        }
        logger->add_backend(std::move(created));
    } else {
        status = Status::failure(ErrorKind::Validation, "unknown audit backend: " + backend);
        return nullptr;
    }

    WARDEN_LOG_INFO("Audit logging enabled: backend={}", backend);
    return logger;
}

}  // namespace warden::audit
