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


// Warden Authorizer - Header
// Role-based access decisions

#pragma once

#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../core/status.hpp"
#include "principal.hpp"

namespace warden::auth {

/// Decides whether a principal may apply a permission to a resource
class Authorizer {
public:
    virtual ~Authorizer() = default;

    [[nodiscard]] virtual core::Status authorize(const Principal* principal,
                                                 std::string_view resource,
                                                 Permission permission) const = 0;
};

/// RBAC with seeded roles:
///   admin    = {read, write, execute, admin}
///   user     = {read, execute}
///   readonly = {read}
/// A principal is granted when it holds the permission (or admin) directly,
/// or when any of its roles maps to the permission (or admin).
class RbacAuthorizer final : public Authorizer {
public:
    RbacAuthorizer();

    RbacAuthorizer(const RbacAuthorizer&) = delete;
    RbacAuthorizer& operator=(const RbacAuthorizer&) = delete;

    [[nodiscard]] core::Status authorize(const Principal* principal, std::string_view resource,
                                         Permission permission) const override;

    /// Idempotent
    void add_role_permission(std::string_view role, Permission permission);

    /// Permissions mapped to `role` (empty for an unknown role)
    [[nodiscard]] std::vector<Permission> role_permissions(std::string_view role) const;

private:
    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, std::vector<Permission>> role_permissions_;
};

/// Grants everything to any non-null principal (development wiring only)
class AllowAllAuthorizer final : public Authorizer {
public:
    [[nodiscard]] core::Status authorize(const Principal* principal, std::string_view resource,
                                         Permission permission) const override;
};

}  // namespace warden::auth
