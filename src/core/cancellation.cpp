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


// Warden Cancellation - Implementation

#include "cancellation.hpp"

#include <algorithm>

namespace warden::core {

std::shared_ptr<CancellationToken> CancellationToken::create() {
    return std::shared_ptr<CancellationToken>(new CancellationToken());
}

std::shared_ptr<CancellationToken> CancellationToken::child_of(
    const std::shared_ptr<CancellationToken>& parent) {
    auto child = create();
    if (parent) {
        child->deadline_ = parent->deadline();
        child->attach(parent);
    }
    return child;
}

std::shared_ptr<CancellationToken> CancellationToken::with_deadline(
    const std::shared_ptr<CancellationToken>& parent, Clock::time_point deadline) {
    auto child = create();
    child->deadline_ = deadline;
    if (parent) {
        auto parent_deadline = parent->deadline();
        if (parent_deadline && *parent_deadline < deadline) {
            child->deadline_ = parent_deadline;
        }
        child->attach(parent);
    }
    return child;
}

void CancellationToken::attach(const std::shared_ptr<CancellationToken>& parent) {
    std::string parent_reason;
    {
        std::lock_guard<std::mutex> lock(parent->mutex_);
        if (parent->cancelled_ || parent->check_deadline_locked()) {
            parent_reason = parent->reason_;
        } else {
            // Drop expired children while we are here
            auto& children = parent->children_;
            children.erase(std::remove_if(children.begin(), children.end(),
                                          [](const auto& w) { return w.expired(); }),
                           children.end());
            children.push_back(weak_from_this());
        }
    }

    if (!parent_reason.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        reason_ = parent_reason;
    }
}

void CancellationToken::cancel() {
    cancel_with(kCanceled);
}

void CancellationToken::cancel_with(const char* reason) {
    std::vector<std::weak_ptr<CancellationToken>> children;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            cancelled_ = true;
            reason_ = reason;
        }
        children.swap(children_);
    }
    cv_.notify_all();

    for (auto& weak : children) {
        if (auto child = weak.lock()) {
            child->cancel_with(reason);
        }
    }
}

bool CancellationToken::check_deadline_locked() const {
    if (!cancelled_ && deadline_ && Clock::now() >= *deadline_) {
        cancelled_ = true;
        reason_ = kDeadlineExceeded;
    }
    return cancelled_;
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_deadline_locked();
}

std::string CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    check_deadline_locked();
    return reason_;
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_;
}

bool CancellationToken::wait_until(Clock::time_point until) const {
    std::unique_lock<std::mutex> lock(mutex_);

    Clock::time_point wake = until;
    if (deadline_ && *deadline_ < wake) {
        wake = *deadline_;
    }

    cv_.wait_until(lock, wake, [this] { return cancelled_; });

    if (check_deadline_locked()) {
        return false;
    }
    return Clock::now() >= until;
}

}  // namespace warden::core
