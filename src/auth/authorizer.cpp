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


// Warden Authorizer - Implementation

#include "authorizer.hpp"

#include <algorithm>
#include <mutex>

namespace warden::auth {

using core::ErrorKind;
using core::Status;

namespace {

bool grants(const std::vector<Permission>& held, Permission wanted) {
    for (Permission p : held) {
        if (p == wanted || p == Permission::Admin) {
            return true;
        }
    }
    return false;
}

}  // namespace

RbacAuthorizer::RbacAuthorizer() {
    role_permissions_["admin"] = {Permission::Read, Permission::Write, Permission::Execute,
                                  Permission::Admin};
    role_permissions_["user"] = {Permission::Read, Permission::Execute};
    role_permissions_["readonly"] = {Permission::Read};
}

Status RbacAuthorizer::authorize(const Principal* principal, std::string_view resource,
                                 Permission permission) const {
    (void)resource;

    if (principal == nullptr) {
        return Status::failure(ErrorKind::Authorization, "no principal provided");
    }

    if (grants(principal->permissions, permission)) {
        return Status::success();
    }

    std::shared_lock lock(mutex_);
    for (const auto& role : principal->roles) {
        auto it = role_permissions_.find(role);
        if (it != role_permissions_.end() && grants(it->second, permission)) {
            return Status::success();
        }
    }

    return Status::failure(ErrorKind::Authorization, "access denied: insufficient permissions");
}

void RbacAuthorizer::add_role_permission(std::string_view role, Permission permission) {
    std::unique_lock lock(mutex_);
    auto& perms = role_permissions_[std::string(role)];
    if (std::find(perms.begin(), perms.end(), permission) == perms.end()) {
        perms.push_back(permission);
    }
}

std::vector<Permission> RbacAuthorizer::role_permissions(std::string_view role) const {
    std::shared_lock lock(mutex_);
    auto it = role_permissions_.find(std::string(role));
    if (it == role_permissions_.end()) {
        return {};
    }
    return it->second;
}

Status AllowAllAuthorizer::authorize(const Principal* principal, std::string_view resource,
                                     Permission permission) const {
    (void)resource;
    (void)permission;
    if (principal == nullptr) {
        return Status::failure(ErrorKind::Authorization, "no principal provided");
    }
    return Status::success();
}

}  // namespace warden::auth
