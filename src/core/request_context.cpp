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


// Warden Request Context - Implementation

#include "request_context.hpp"

#include "logging.hpp"

namespace warden::core {

RequestContext::RequestContext() : token_(CancellationToken::create()) {}

RequestContext::RequestContext(std::shared_ptr<CancellationToken> token)
    : token_(token ? std::move(token) : CancellationToken::create()) {}

const std::string& RequestContext::ensure_request_id() {
    if (request_id_.empty()) {
        request_id_ = logging::generate_correlation_id();
    }
    return request_id_;
}

bool RequestContext::attach_auth(std::shared_ptr<const auth::AuthContext> auth) {
    if (auth_ || !auth) {
        return false;
    }
    auth_ = std::move(auth);
    return true;
}

RequestContext RequestContext::with_timeout(std::chrono::milliseconds timeout) const {
    RequestContext derived = *this;
    derived.token_ =
        CancellationToken::with_deadline(token_, CancellationToken::Clock::now() + timeout);
    return derived;
}

}  // namespace warden::core
