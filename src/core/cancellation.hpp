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


// Warden Cancellation - Header
// Cancellation tokens with optional deadlines, chained parent to child

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::core {

/// Cancellation signal observed by blocking waits.
///
/// A child token is cancelled when its parent is cancelled, when its own
/// deadline passes, or when cancel() is called on it. Cancelling a child
/// never affects the parent.
class CancellationToken : public std::enable_shared_from_this<CancellationToken> {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr const char* kCanceled = "context canceled";
    static constexpr const char* kDeadlineExceeded = "context deadline exceeded";

    /// Root token (never cancelled unless cancel() is called)
    [[nodiscard]] static std::shared_ptr<CancellationToken> create();

    /// Child token; deadline is clamped to the parent's deadline
    [[nodiscard]] static std::shared_ptr<CancellationToken> with_deadline(
        const std::shared_ptr<CancellationToken>& parent, Clock::time_point deadline);

    /// Child token without its own deadline
    [[nodiscard]] static std::shared_ptr<CancellationToken> child_of(
        const std::shared_ptr<CancellationToken>& parent);

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Cancel this token and all descendants (idempotent)
    void cancel();

    [[nodiscard]] bool is_cancelled() const;

    /// "context canceled" or "context deadline exceeded"; empty while live
    [[nodiscard]] std::string reason() const;

    [[nodiscard]] std::optional<Clock::time_point> deadline() const;

    /// Block until `until` or cancellation, whichever is first.
    /// Returns true if `until` was reached without cancellation.
    [[nodiscard]] bool wait_until(Clock::time_point until) const;

    template <typename Rep, typename Period>
    [[nodiscard]] bool wait_for(std::chrono::duration<Rep, Period> d) const {
        return wait_until(Clock::now() + std::chrono::duration_cast<Clock::duration>(d));
    }

private:
    CancellationToken() = default;

    void cancel_with(const char* reason);
    void attach(const std::shared_ptr<CancellationToken>& parent);

    // Expire the token if its deadline has passed; caller holds mutex_
    bool check_deadline_locked() const;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable bool cancelled_ = false;
    mutable std::string reason_;
    std::optional<Clock::time_point> deadline_;
    std::vector<std::weak_ptr<CancellationToken>> children_;
};

}  // namespace warden::core
