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


// Warden Circuit Breaker - Implementation

#include "circuit_breaker.hpp"

#include "../core/logging.hpp"

namespace warden::gateway {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config) : config_(std::move(config)) {}

bool CircuitBreaker::should_allow_request() {
    std::lock_guard lock(mutex_);

    switch (state_) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN: {
            auto since_failure = Clock::now() - last_failure_time_;
            if (since_failure > std::chrono::milliseconds(config_.reset_timeout_ms)) {
                transition_to_locked(CircuitState::HALF_OPEN, "reset timeout expired, probing");
                failures_ = 0;
                probe_in_flight_ = true;
                return true;
            }
            break;
        }

        case CircuitState::HALF_OPEN:
            if (!probe_in_flight_) {
                probe_in_flight_ = true;
                return true;
            }
            break;
    }

    rejected_requests_.fetch_add(1, std::memory_order_relaxed);
    return false;
}

void CircuitBreaker::record_success() {
    total_successes_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard lock(mutex_);
    // Late result from a call admitted before the breaker opened
    if (state_ == CircuitState::OPEN) {
        return;
    }
    failures_ = 0;
    probe_in_flight_ = false;
    if (state_ == CircuitState::HALF_OPEN) {
        transition_to_locked(CircuitState::CLOSED, "probe succeeded");
    }
}

void CircuitBreaker::record_failure() {
    total_failures_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard lock(mutex_);
    ++failures_;
    last_failure_time_ = Clock::now();
    probe_in_flight_ = false;

    if (state_ == CircuitState::HALF_OPEN) {
        transition_to_locked(CircuitState::OPEN, "probe failed");
        return;
    }

    if (state_ == CircuitState::CLOSED && failures_ >= config_.max_failures) {
        transition_to_locked(CircuitState::OPEN, "failure threshold reached");
    }
}

core::Status CircuitBreaker::execute(const std::function<core::Status()>& fn) {
    if (!should_allow_request()) {
        return core::Status::failure(core::ErrorKind::CircuitOpen, "circuit breaker is open");
    }

    core::Status result;
    try {
        result = fn();
    } catch (...) {
        record_failure();
        throw;
    }

    if (result) {
        record_success();
    } else {
        record_failure();
    }
    return result;
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    failures_ = 0;
    probe_in_flight_ = false;
    if (state_ != CircuitState::CLOSED) {
        transition_to_locked(CircuitState::CLOSED, "manual reset");
    }
}

CircuitBreakerMetrics CircuitBreaker::metrics() const noexcept {
    CircuitBreakerMetrics m;
    m.total_failures = total_failures_.load(std::memory_order_relaxed);
    m.total_successes = total_successes_.load(std::memory_order_relaxed);
    m.rejected_requests = rejected_requests_.load(std::memory_order_relaxed);
    m.state_transitions = state_transitions_.load(std::memory_order_relaxed);
    return m;
}

void CircuitBreaker::transition_to_locked(CircuitState new_state, std::string_view reason) {
    CircuitState old_state = state_;
    if (old_state == new_state) {
        return;
    }
    state_ = new_state;
    state_transitions_.fetch_add(1, std::memory_order_relaxed);

    if (new_state == CircuitState::OPEN) {
        WARDEN_LOG_WARNING("Circuit breaker '{}' {} -> {} ({}, {} failures)", config_.name,
                           to_string(old_state), to_string(new_state), reason, failures_);
    } else {
        WARDEN_LOG_INFO("Circuit breaker '{}' {} -> {} ({})", config_.name, to_string(old_state),
                        to_string(new_state), reason);
    }
}

}  // namespace warden::gateway
