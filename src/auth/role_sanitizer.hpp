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


// Warden Role Sanitizer - Header
// Filters role names taken from request headers

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace warden::auth {

/// Longest accepted custom role name
inline constexpr size_t kMaxRoleLength = 64;

/// True for an allow-listed role (user, admin, viewer, editor, operator) or a
/// custom name matching ^[a-zA-Z0-9_-]{1,64}$, after trimming and lower-casing
[[nodiscard]] bool validate_role(std::string_view role);

/// Trim, lower-case, drop invalid and duplicate roles (order kept).
/// An empty result becomes {"user"}.
[[nodiscard]] std::vector<std::string> sanitize_roles(const std::vector<std::string>& roles);

}  // namespace warden::auth
