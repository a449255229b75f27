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


// Warden Audit Middleware - Implementation

#include "audit_middleware.hpp"

#include <chrono>

#include "../core/logging.hpp"
#include "../security/sanitize.hpp"

namespace warden::audit {

namespace {

void record_call(AuditLogger& logger, const core::RequestContext& ctx, const std::string& tool,
                 const nlohmann::json& args, std::chrono::system_clock::time_point started,
                 std::chrono::steady_clock::duration elapsed, const core::Status& status) {
    StructuredAuditEvent event;
    event.id = logging::generate_uuid();
    event.timestamp = started;
    event.type = std::string(event_type::kToolCall);
    event.resource = tool;
    event.action = "execute";
    event.duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
    event.metadata = describe_arguments(args);

    if (status) {
        event.result = "success";
    } else {
        event.result = "failure";
        event.error = security::sanitize_error_message(status.error);
    }

    logger.log(ctx, std::move(event));
}

}  // namespace

AuditMiddleware::AuditMiddleware(std::shared_ptr<AuditLogger> logger)
    : logger_(std::move(logger)) {}

ToolHandler AuditMiddleware::wrap_handler(std::string tool, ToolHandler handler) const {
    return [logger = logger_, tool = std::move(tool), handler = std::move(handler)](
               core::RequestContext& ctx, const nlohmann::json& args) -> ToolResult {
        ctx.ensure_request_id();
        auto started = std::chrono::system_clock::now();
        auto start = std::chrono::steady_clock::now();

        ToolResult result;
        try {
            result = handler(ctx, args);
        } catch (const std::exception& e) {
            if (logger) {
                record_call(*logger, ctx, tool, args, started,
                            std::chrono::steady_clock::now() - start,
                            core::Status::failure(core::ErrorKind::Internal, e.what()));
            }
            throw;
        }

        if (logger) {
            record_call(*logger, ctx, tool, args, started, std::chrono::steady_clock::now() - start,
                        result.status);
        }
        return result;
    };
}

}  // namespace warden::audit
