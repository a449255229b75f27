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


// Warden Role Sanitizer - Implementation

#include "role_sanitizer.hpp"

#include <algorithm>
#include <array>

#include "../core/string_utils.hpp"

namespace warden::auth {

namespace {

constexpr std::array<std::string_view, 5> kAllowedRoles = {"user", "admin", "viewer", "editor",
                                                           "operator"};

bool is_role_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
}

}  // namespace

bool validate_role(std::string_view role) {
    std::string normalized = core::to_lower(core::trim(role));
    if (normalized.empty()) {
        return false;
    }

    if (std::find(kAllowedRoles.begin(), kAllowedRoles.end(), normalized) != kAllowedRoles.end()) {
        return true;
    }

    return normalized.size() <= kMaxRoleLength &&
           std::all_of(normalized.begin(), normalized.end(), is_role_char);
}

std::vector<std::string> sanitize_roles(const std::vector<std::string>& roles) {
    std::vector<std::string> valid;
    for (const auto& role : roles) {
        if (!validate_role(role)) {
            continue;
        }
        std::string normalized = core::to_lower(core::trim(role));
        if (std::find(valid.begin(), valid.end(), normalized) == valid.end()) {
            valid.push_back(std::move(normalized));
        }
    }

    if (valid.empty()) {
        valid.emplace_back("user");
    }
    return valid;
}

}  // namespace warden::auth
