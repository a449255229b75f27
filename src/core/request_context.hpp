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


// Warden Request Context - Header
// Request-scoped identifiers, attached identity and cancellation

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "cancellation.hpp"

namespace warden::auth {
struct AuthContext;
}

namespace warden::core {

/// Per-request state passed by reference through the mediation layer.
///
/// Copies share the cancellation token and the attached AuthContext.
/// Never stored globally; lives as long as the request.
class RequestContext {
public:
    RequestContext();

    /// Context bound to an existing cancellation token
    explicit RequestContext(std::shared_ptr<CancellationToken> token);

    // Tracing identifiers (empty when unset)
    [[nodiscard]] const std::string& request_id() const noexcept { return request_id_; }
    [[nodiscard]] const std::string& trace_id() const noexcept { return trace_id_; }
    [[nodiscard]] const std::string& span_id() const noexcept { return span_id_; }

    void set_request_id(std::string id) { request_id_ = std::move(id); }
    void set_trace_id(std::string id) { trace_id_ = std::move(id); }
    void set_span_id(std::string id) { span_id_ = std::move(id); }

    /// Assign a generated request id if none is set; returns the id
    const std::string& ensure_request_id();

    /// Attach the authenticated identity. Fails if one is already attached.
    [[nodiscard]] bool attach_auth(std::shared_ptr<const auth::AuthContext> auth);

    /// Attached identity, or nullptr
    [[nodiscard]] const auth::AuthContext* auth() const noexcept { return auth_.get(); }

    [[nodiscard]] const std::shared_ptr<CancellationToken>& cancellation() const noexcept {
        return token_;
    }

    [[nodiscard]] bool is_cancelled() const { return token_->is_cancelled(); }

    /// Derived context cancelled after `timeout` or when this one is
    [[nodiscard]] RequestContext with_timeout(std::chrono::milliseconds timeout) const;

private:
    std::string request_id_;
    std::string trace_id_;
    std::string span_id_;
    std::shared_ptr<const auth::AuthContext> auth_;
    std::shared_ptr<CancellationToken> token_;
};

}  // namespace warden::core
