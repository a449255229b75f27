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


// Warden Rate Limiting - Implementation

#include "rate_limit.hpp"

#include <algorithm>
#include <cmath>

#include "../core/logging.hpp"

namespace warden::gateway {

using core::ErrorKind;
using core::Status;

// ============================================================================
// TokenBucket
// ============================================================================

TokenBucket::TokenBucket(double rate, uint32_t burst)
    : rate_(rate), burst_(burst), tokens_(static_cast<double>(burst)), last_refill_(Clock::now()) {}

void TokenBucket::refill_locked(Clock::time_point now) {
    if (now <= last_refill_) {
        return;
    }
    if (rate_ > 0) {
        double elapsed = std::chrono::duration<double>(now - last_refill_).count();
        tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed * rate_);
    }
    last_refill_ = now;
}

bool TokenBucket::try_consume() {
    Clock::duration unused{};
    return try_consume(unused);
}

bool TokenBucket::try_consume(Clock::duration& wait_hint) {
    std::lock_guard lock(mutex_);
    refill_locked(Clock::now());

    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        wait_hint = Clock::duration::zero();
        return true;
    }

    if (rate_ <= 0 || burst_ == 0) {
        wait_hint = Clock::duration::max();
    } else {
        double seconds = (1.0 - tokens_) / rate_;
        wait_hint = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(seconds));
    }
    return false;
}

double TokenBucket::available() {
    std::lock_guard lock(mutex_);
    refill_locked(Clock::now());
    return tokens_;
}

void TokenBucket::reset() {
    std::lock_guard lock(mutex_);
    tokens_ = static_cast<double>(burst_);
    last_refill_ = Clock::now();
}

Status wait_for_token(TokenBucket& bucket, const core::CancellationToken& cancel) {
    while (true) {
        if (cancel.is_cancelled()) {
            return Status::failure(ErrorKind::RateLimited, cancel.reason());
        }

        TokenBucket::Clock::duration wait_hint{};
        if (bucket.try_consume(wait_hint)) {
            return Status::success();
        }

        auto now = TokenBucket::Clock::now();
        auto deadline = cancel.deadline();

        // A token that cannot arrive before the deadline is never worth waiting for
        if (wait_hint == TokenBucket::Clock::duration::max()) {
            if (deadline) {
                (void)cancel.wait_until(*deadline);
                return Status::failure(ErrorKind::RateLimited,
                                       core::CancellationToken::kDeadlineExceeded);
            }
            (void)cancel.wait_for(std::chrono::seconds(1));
            continue;
        }
        if (deadline && now + wait_hint > *deadline) {
            return Status::failure(ErrorKind::RateLimited,
                                   core::CancellationToken::kDeadlineExceeded);
        }

        if (!cancel.wait_until(now + wait_hint)) {
            return Status::failure(ErrorKind::RateLimited, cancel.reason());
        }
    }
}

// ============================================================================
// RateLimiter
// ============================================================================

RateLimiter::RateLimiter(double requests_per_second, uint32_t burst)
    : rate_(requests_per_second), burst_(burst), global_(requests_per_second, burst) {}

std::shared_ptr<TokenBucket> RateLimiter::client_bucket(std::string_view client_id) {
    std::string key(client_id);
    {
        std::shared_lock lock(mutex_);
        auto it = clients_.find(key);
        if (it != clients_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(mutex_);
    auto it = clients_.find(key);
    if (it != clients_.end()) {
        return it->second;
    }
    auto [inserted, _] = clients_.emplace(std::move(key), std::make_shared<TokenBucket>(rate_, burst_));
    return inserted->second;
}

bool RateLimiter::allow(std::string_view client_id) {
    if (!global_.try_consume()) {
        return false;
    }
    return client_bucket(client_id)->try_consume();
}

Status RateLimiter::wait(std::string_view client_id, const core::CancellationToken& cancel) {
    if (auto status = wait_for_token(global_, cancel); !status) {
        WARDEN_LOG_INFO("Rate limit wait aborted (global): {}", status.error);
        return Status::failure(ErrorKind::RateLimited, "global rate limit: " + status.error);
    }

    // Held by value: a concurrent reset() drops the map entry, not the bucket
    auto bucket = client_bucket(client_id);
    if (auto status = wait_for_token(*bucket, cancel); !status) {
        WARDEN_LOG_INFO("Rate limit wait aborted (client {}): {}", client_id, status.error);
        return Status::failure(ErrorKind::RateLimited, "client rate limit: " + status.error);
    }

    return Status::success();
}

void RateLimiter::reset(std::string_view client_id) {
    std::unique_lock lock(mutex_);
    clients_.erase(std::string(client_id));
}

size_t RateLimiter::client_count() const {
    std::shared_lock lock(mutex_);
    return clients_.size();
}

// ============================================================================
// ToolRateLimiter
// ============================================================================

void ToolRateLimiter::set_tool_limit(std::string_view tool, double requests_per_second,
                                     uint32_t burst) {
    auto bucket = std::make_shared<TokenBucket>(requests_per_second, burst);
    std::unique_lock lock(mutex_);
    tools_[std::string(tool)] = std::move(bucket);
}

std::shared_ptr<TokenBucket> ToolRateLimiter::find(std::string_view tool) const {
    std::shared_lock lock(mutex_);
    auto it = tools_.find(std::string(tool));
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ToolRateLimiter::allow(std::string_view tool) {
    auto bucket = find(tool);
    if (!bucket) {
        return true;
    }
    return bucket->try_consume();
}

Status ToolRateLimiter::wait(std::string_view tool, const core::CancellationToken& cancel) {
    auto bucket = find(tool);
    if (!bucket) {
        return Status::success();
    }
    return wait_for_token(*bucket, cancel);
}

bool ToolRateLimiter::has_limit(std::string_view tool) const {
    return find(tool) != nullptr;
}

}  // namespace warden::gateway
