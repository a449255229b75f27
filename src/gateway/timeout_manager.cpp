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


// Warden Timeout Manager - Implementation

#include "timeout_manager.hpp"

#include <mutex>

namespace warden::gateway {

TimeoutManager::TimeoutManager(std::chrono::milliseconds default_timeout)
    : default_timeout_(default_timeout) {}

void TimeoutManager::set_tool_timeout(std::string_view tool, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    tool_timeouts_[std::string(tool)] = timeout;
}

std::chrono::milliseconds TimeoutManager::get_timeout(std::string_view tool) const {
    std::shared_lock lock(mutex_);
    auto it = tool_timeouts_.find(std::string(tool));
    if (it != tool_timeouts_.end()) {
        return it->second;
    }
    return default_timeout_;
}

core::RequestContext TimeoutManager::with_timeout(const core::RequestContext& ctx,
                                                  std::string_view tool) const {
    return ctx.with_timeout(get_timeout(tool));
}

}  // namespace warden::gateway
