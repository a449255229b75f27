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


// Warden Audit Middleware - Header
// Wraps tool handlers so every invocation leaves a tool.call audit event

#pragma once

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "../core/request_context.hpp"
#include "../core/status.hpp"
#include "audit_logger.hpp"

namespace warden::audit {

/// Outcome of one tool invocation
struct ToolResult {
    core::Status status;
    nlohmann::json value;
};

using ToolHandler = std::function<ToolResult(core::RequestContext&, const nlohmann::json&)>;

class AuditMiddleware {
public:
    explicit AuditMiddleware(std::shared_ptr<AuditLogger> logger);

    /// Returned handler ensures a request id, times the call and writes a
    /// tool.call event (duration_ns, success/failure, sanitized error).
    /// The handler's result is returned untouched; exceptions are recorded
    /// as failures and rethrown.
    [[nodiscard]] ToolHandler wrap_handler(std::string tool, ToolHandler handler) const;

    [[nodiscard]] const std::shared_ptr<AuditLogger>& logger() const noexcept { return logger_; }

private:
    std::shared_ptr<AuditLogger> logger_;
};

}  // namespace warden::audit
