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


// Warden Principal - Header
// Authenticated identity, permissions and the per-request auth context

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::auth {

/// Closed permission set. Admin overrides every other permission.
enum class Permission : uint8_t { Read, Write, Execute, Admin };

[[nodiscard]] constexpr std::string_view to_string(Permission permission) noexcept {
    switch (permission) {
        case Permission::Read:
            return "read";
        case Permission::Write:
            return "write";
        case Permission::Execute:
            return "execute";
        case Permission::Admin:
            return "admin";
    }
    return "unknown";
}

/// Parse a wire name (read|write|execute|admin)
[[nodiscard]] inline std::optional<Permission> parse_permission(std::string_view name) {
    if (name == "read") return Permission::Read;
    if (name == "write") return Permission::Write;
    if (name == "execute") return Permission::Execute;
    if (name == "admin") return Permission::Admin;
    return std::nullopt;
}

/// Authenticated identity. Treated as immutable once attached to a request.
struct Principal {
    std::string id;
    std::string name;
    std::vector<std::string> roles;  // Ordered, no duplicates
    std::vector<Permission> permissions;
    std::map<std::string, std::string> metadata;

    [[nodiscard]] bool has_permission(Permission permission) const {
        return std::find(permissions.begin(), permissions.end(), permission) != permissions.end();
    }

    [[nodiscard]] bool has_role(std::string_view role) const {
        return std::find(roles.begin(), roles.end(), role) != roles.end();
    }

    [[nodiscard]] std::string metadata_value(const std::string& key) const {
        auto it = metadata.find(key);
        return it != metadata.end() ? it->second : std::string{};
    }
};

/// Identity plus connection details for one request
struct AuthContext {
    Principal principal;
    std::string session_id;
    std::string client_ip;
    std::string user_agent;
    std::chrono::system_clock::time_point request_time = std::chrono::system_clock::now();
};

}  // namespace warden::auth
