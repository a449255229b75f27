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


// Warden Authenticator - Header
// Credential verification strategies

#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "principal.hpp"

namespace warden::auth {

/// Outcome of authenticating one credential
struct AuthResult {
    bool valid = false;
    Principal principal;
    std::string error;

    [[nodiscard]] static AuthResult success(Principal principal) {
        return {true, std::move(principal), {}};
    }

    [[nodiscard]] static AuthResult failure(std::string error) {
        return {false, {}, std::move(error)};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// Verifies a raw credential and yields the matching principal
class Authenticator {
public:
    virtual ~Authenticator() = default;

    [[nodiscard]] virtual AuthResult authenticate(std::string_view credential) const = 0;
};

/// Static API key table. Every lookup compares the credential against all
/// stored keys in constant time; a match never ends the scan early.
class ApiKeyAuthenticator final : public Authenticator {
public:
    ApiKeyAuthenticator() = default;

    ApiKeyAuthenticator(const ApiKeyAuthenticator&) = delete;
    ApiKeyAuthenticator& operator=(const ApiKeyAuthenticator&) = delete;

    /// Register (or replace) the principal for `key`
    void add_key(std::string key, Principal principal);

    [[nodiscard]] AuthResult authenticate(std::string_view credential) const override;

    [[nodiscard]] size_t key_count() const;

private:
    struct Entry {
        std::string key;
        Principal principal;
    };

    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
};

}  // namespace warden::auth
