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


// Warden Circuit Breaker - Header
// Stops calling a failing dependency until a reset timeout has passed

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

#include "../core/status.hpp"

namespace warden::gateway {

/// Circuit breaker state
enum class CircuitState : uint8_t {
    CLOSED,    // Normal operation, requests allowed
    OPEN,      // Dependency failing, requests rejected
    HALF_OPEN  // Single probe admitted to test recovery
};

/// Circuit breaker configuration
struct CircuitBreakerConfig {
    /// Consecutive failures that open the circuit
    uint32_t max_failures = 5;

    /// Time in milliseconds after the last failure before a probe is admitted
    uint32_t reset_timeout_ms = 30000;

    /// Label used in transition logs
    std::string name = "default";
};

/// Counters for observability (monotonic)
struct CircuitBreakerMetrics {
    uint64_t total_failures = 0;
    uint64_t total_successes = 0;
    uint64_t rejected_requests = 0;
    uint64_t state_transitions = 0;
};

/// Circuit breaker shared by concurrent callers.
///
/// State machine:
///   CLOSED → OPEN (max_failures consecutive failures)
///   OPEN → HALF_OPEN (reset_timeout_ms after the last failure; one probe)
///   HALF_OPEN → CLOSED (probe succeeded)
///   HALF_OPEN → OPEN (probe failed)
///
/// One mutex per instance, held only while inspecting or changing state.
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    explicit CircuitBreaker(CircuitBreakerConfig config = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Admit or reject a request. In HALF_OPEN only one probe is in flight.
    [[nodiscard]] bool should_allow_request();

    void record_success();

    void record_failure();

    /// Run `fn` through the breaker. Rejected calls fail with
    /// "circuit breaker is open" (kind CircuitOpen) and `fn` is not called.
    [[nodiscard]] core::Status execute(const std::function<core::Status()>& fn);

    [[nodiscard]] CircuitState state() const;

    /// Force CLOSED and clear the failure counter
    void reset();

    [[nodiscard]] CircuitBreakerMetrics metrics() const noexcept;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    // Caller holds mutex_
    void transition_to_locked(CircuitState new_state, std::string_view reason);

    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint32_t failures_ = 0;
    bool probe_in_flight_ = false;
    Clock::time_point last_failure_time_{};

    // Metrics (atomic so metrics() never blocks)
    std::atomic<uint64_t> total_failures_{0};
    std::atomic<uint64_t> total_successes_{0};
    std::atomic<uint64_t> rejected_requests_{0};
    std::atomic<uint64_t> state_transitions_{0};
};

/// Convert circuit state to string for logging
[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::CLOSED:
            return "CLOSED";
        case CircuitState::OPEN:
            return "OPEN";
        case CircuitState::HALF_OPEN:
            return "HALF_OPEN";
    }
    return "UNKNOWN";
}

}  // namespace warden::gateway
