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


// Warden JWK Cache - Header
// RSA signing keys fetched from published JWK sets, cached with a TTL

#pragma once

#include <openssl/evp.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../core/cancellation.hpp"
#include "../core/containers.hpp"
#include "../core/status.hpp"

namespace warden::auth {

/// Smallest accepted RSA modulus
inline constexpr int kMinRsaKeyBits = 2048;

/// Google IAP signing keys
inline constexpr const char* kIapJwkEndpoint = "https://www.gstatic.com/iap/verify/public_key-jwk";

/// Google OAuth2 signing keys
inline constexpr const char* kOAuth2JwkEndpoint = "https://www.googleapis.com/oauth2/v3/certs";

/// Owned OpenSSL public key (move-only)
class RsaPublicKey {
public:
    explicit RsaPublicKey(EVP_PKEY* key) noexcept : key_(key) {}
    ~RsaPublicKey();

    RsaPublicKey(RsaPublicKey&& other) noexcept : key_(other.key_) { other.key_ = nullptr; }
    RsaPublicKey& operator=(RsaPublicKey&& other) noexcept;

    RsaPublicKey(const RsaPublicKey&) = delete;
    RsaPublicKey& operator=(const RsaPublicKey&) = delete;

    [[nodiscard]] EVP_PKEY* get() const noexcept { return key_; }

    /// Modulus size in bits
    [[nodiscard]] int bits() const noexcept;

private:
    EVP_PKEY* key_ = nullptr;
};

/// Key lookup outcome
struct KeyLookup {
    std::shared_ptr<const RsaPublicKey> key;
    std::string error;

    [[nodiscard]] explicit operator bool() const noexcept { return key != nullptr; }
};

/// JWK cache settings
struct JwkCacheConfig {
    std::vector<std::string> endpoints = {kIapJwkEndpoint, kOAuth2JwkEndpoint};
    std::chrono::seconds ttl{3600};
    uint32_t timeout_seconds = 10;  // Connect and read timeout per endpoint
};

/// Convert one RSA JWK object into a key. Rejects non-RSA keys, moduli
/// below 2048 bits and exponents below 3.
[[nodiscard]] KeyLookup parse_rsa_jwk(const std::string& jwk_json);

/// Thread-safe cache of signing keys by key id.
///
/// Constructed explicitly and shared with verifiers through shared_ptr.
/// A lookup that misses (or finds the cache expired) refreshes from the
/// endpoints in order; the first endpoint that answers replaces the key set.
/// When every endpoint fails, the previous keys are still served.
class JwkCache {
public:
    explicit JwkCache(JwkCacheConfig config = {});
    ~JwkCache();

    // Non-copyable, non-movable (owns thread)
    JwkCache(const JwkCache&) = delete;
    JwkCache& operator=(const JwkCache&) = delete;
    JwkCache(JwkCache&&) = delete;
    JwkCache& operator=(JwkCache&&) = delete;

    [[nodiscard]] KeyLookup get_key(std::string_view kid);

    /// Fetch from the endpoints now. The network calls run without the lock.
    [[nodiscard]] core::Status refresh();

    /// Install a JWK set document ({"keys":[...]}) directly
    [[nodiscard]] core::Status load_from_json(std::string_view jwks_json);

    [[nodiscard]] size_t key_count() const;

    /// True when the cached key set has outlived the TTL (or was never loaded)
    [[nodiscard]] bool expired() const;

    /// Start the background refresh thread (refreshes every TTL)
    void start();

    /// Stop and join the refresh thread
    void stop();

private:
    using KeyMap = core::fast_map<std::string, std::shared_ptr<const RsaPublicKey>>;
    using Clock = std::chrono::steady_clock;

    void refresh_loop(std::shared_ptr<core::CancellationToken> stop_token);

    [[nodiscard]] core::Status http_get(const std::string& url, std::string& body) const;

    [[nodiscard]] static core::Status parse_jwks(std::string_view json, KeyMap& keys);

    void install(KeyMap keys);

    JwkCacheConfig config_;

    mutable std::shared_mutex mutex_;
    KeyMap keys_;
    Clock::time_point expires_at_{};

    std::shared_ptr<core::CancellationToken> stop_token_;
    std::unique_ptr<std::thread> refresh_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace warden::auth
