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


// Warden Rate Limiting - Header
// Shared token buckets: global + per-client limiter, per-tool limiter

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "../core/cancellation.hpp"
#include "../core/containers.hpp"
#include "../core/status.hpp"

namespace warden::gateway {

/// Token bucket with fractional refill (thread-safe)
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    /// @param rate Tokens added per second (fractional allowed; <= 0 never refills)
    /// @param burst Maximum number of tokens; the bucket starts full
    TokenBucket(double rate, uint32_t burst);

    // Non-copyable, non-movable (owns a mutex)
    TokenBucket(const TokenBucket&) = delete;
    TokenBucket& operator=(const TokenBucket&) = delete;

    /// Take one token if available
    [[nodiscard]] bool try_consume();

    /// Take one token, or report how long until one is available
    [[nodiscard]] bool try_consume(Clock::duration& wait_hint);

    /// Current tokens (after refill)
    [[nodiscard]] double available();

    [[nodiscard]] double rate() const noexcept { return rate_; }
    [[nodiscard]] uint32_t burst() const noexcept { return burst_; }

    /// Refill to capacity
    void reset();

private:
    void refill_locked(Clock::time_point now);

    const double rate_;
    const uint32_t burst_;
    std::mutex mutex_;
    double tokens_;
    Clock::time_point last_refill_;
};

/// Block until `bucket` yields a token or `cancel` fires.
/// Returns success, or a failure whose error is the cancellation reason.
[[nodiscard]] core::Status wait_for_token(TokenBucket& bucket, const core::CancellationToken& cancel);

/// Global bucket plus lazily created per-client buckets
class RateLimiter {
public:
    RateLimiter(double requests_per_second, uint32_t burst);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Non-blocking: global bucket first, then the client's
    [[nodiscard]] bool allow(std::string_view client_id);

    /// Blocking variant; fails with "global rate limit: <reason>" or
    /// "client rate limit: <reason>" when cancelled
    [[nodiscard]] core::Status wait(std::string_view client_id,
                                    const core::CancellationToken& cancel);

    /// Drop a client's bucket (next use starts full)
    void reset(std::string_view client_id);

    [[nodiscard]] size_t client_count() const;

private:
    std::shared_ptr<TokenBucket> client_bucket(std::string_view client_id);

    const double rate_;
    const uint32_t burst_;
    TokenBucket global_;
    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, std::shared_ptr<TokenBucket>> clients_;
};

/// Per-tool limits; tools without a configured limit are unlimited
class ToolRateLimiter {
public:
    ToolRateLimiter() = default;

    ToolRateLimiter(const ToolRateLimiter&) = delete;
    ToolRateLimiter& operator=(const ToolRateLimiter&) = delete;

    /// Install (or replace) a tool's limit
    void set_tool_limit(std::string_view tool, double requests_per_second, uint32_t burst);

    [[nodiscard]] bool allow(std::string_view tool);

    [[nodiscard]] core::Status wait(std::string_view tool, const core::CancellationToken& cancel);

    [[nodiscard]] bool has_limit(std::string_view tool) const;

private:
    std::shared_ptr<TokenBucket> find(std::string_view tool) const;

    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, std::shared_ptr<TokenBucket>> tools_;
};

}  // namespace warden::gateway
