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


// Warden Authenticator - Implementation

#include "authenticator.hpp"

#include <openssl/crypto.h>

namespace warden::auth {

void ApiKeyAuthenticator::add_key(std::string key, Principal principal) {
    std::unique_lock lock(mutex_);
    for (auto& entry : entries_) {
        if (entry.key == key) {
            entry.principal = std::move(principal);
            return;
        }
    }
    entries_.push_back({std::move(key), std::move(principal)});
}

AuthResult ApiKeyAuthenticator::authenticate(std::string_view credential) const {
    if (credential.empty()) {
        return AuthResult::failure("missing authentication token");
    }

    std::shared_lock lock(mutex_);

    const Entry* match = nullptr;
    for (const auto& entry : entries_) {
        // Length is not secret; contents are compared with CRYPTO_memcmp
        bool equal = entry.key.size() == credential.size() &&
                     CRYPTO_memcmp(entry.key.data(), credential.data(), credential.size()) == 0;
        if (equal && match == nullptr) {
            match = &entry;
        }
    }

    if (match == nullptr) {
        return AuthResult::failure("invalid authentication token");
    }
    return AuthResult::success(match->principal);
}

size_t ApiKeyAuthenticator::key_count() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace warden::auth
