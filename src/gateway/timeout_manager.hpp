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


// Warden Timeout Manager - Header
// Per-tool execution deadlines with a default

#pragma once

#include <chrono>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "../core/containers.hpp"
#include "../core/request_context.hpp"

namespace warden::gateway {

class TimeoutManager {
public:
    explicit TimeoutManager(std::chrono::milliseconds default_timeout);

    TimeoutManager(const TimeoutManager&) = delete;
    TimeoutManager& operator=(const TimeoutManager&) = delete;

    void set_tool_timeout(std::string_view tool, std::chrono::milliseconds timeout);

    /// Tool override, or the default
    [[nodiscard]] std::chrono::milliseconds get_timeout(std::string_view tool) const;

    /// Derived context whose deadline is min(parent deadline, now + timeout);
    /// cancelled when the parent is
    [[nodiscard]] core::RequestContext with_timeout(const core::RequestContext& ctx,
                                                    std::string_view tool) const;

    [[nodiscard]] std::chrono::milliseconds default_timeout() const noexcept {
        return default_timeout_;
    }

private:
    const std::chrono::milliseconds default_timeout_;
    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, std::chrono::milliseconds> tool_timeouts_;
};

}  // namespace warden::gateway
