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


// Warden JWK Cache - Implementation

#include "jwk_cache.hpp"

#include <httplib.h>
#include <openssl/bn.h>
#include <openssl/rsa.h>

#include <mutex>
#include <nlohmann/json.hpp>

#include "../core/base64.hpp"
#include "../core/logging.hpp"
#include "../http/url.hpp"

namespace warden::auth {

using core::ErrorKind;
using core::Status;

// ============================================================================
// RsaPublicKey
// ============================================================================

RsaPublicKey::~RsaPublicKey() {
    if (key_ != nullptr) {
        EVP_PKEY_free(key_);
    }
}

RsaPublicKey& RsaPublicKey::operator=(RsaPublicKey&& other) noexcept {
    if (this != &other) {
        if (key_ != nullptr) {
            EVP_PKEY_free(key_);
        }
        key_ = other.key_;
        other.key_ = nullptr;
    }
    return *this;
}

int RsaPublicKey::bits() const noexcept {
    return key_ != nullptr ? EVP_PKEY_bits(key_) : 0;
}

// ============================================================================
// JWK parsing
// ============================================================================

namespace {

KeyLookup lookup_error(std::string error) {
    KeyLookup result;
    result.error = std::move(error);
    return result;
}

}  // namespace

KeyLookup parse_rsa_jwk(const std::string& jwk_json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(jwk_json);
    } catch (const nlohmann::json::exception& e) {
        return lookup_error(std::string("failed to decode JWK: ") + e.what());
    }
    if (!j.is_object()) {
        return lookup_error("failed to decode JWK: not an object");
    }

    std::string kty = j.value("kty", "");
    if (kty != "RSA") {
        return lookup_error("unsupported key type: " + kty);
    }

    auto n_bin = core::base64url_decode(j.value("n", ""));
    if (!n_bin || n_bin->empty()) {
        return lookup_error("failed to decode modulus");
    }
    auto e_bin = core::base64url_decode(j.value("e", ""));
    if (!e_bin || e_bin->empty()) {
        return lookup_error("failed to decode exponent");
    }

    BIGNUM* n_bn = BN_bin2bn(reinterpret_cast<const unsigned char*>(n_bin->data()),
                             static_cast<int>(n_bin->size()), nullptr);
    BIGNUM* e_bn = BN_bin2bn(reinterpret_cast<const unsigned char*>(e_bin->data()),
                             static_cast<int>(e_bin->size()), nullptr);
    if (n_bn == nullptr || e_bn == nullptr) {
        BN_free(n_bn);
        BN_free(e_bn);
        return lookup_error("failed to allocate RSA parameters");
    }

    if (BN_num_bits(n_bn) < kMinRsaKeyBits) {
        BN_free(n_bn);
        BN_free(e_bn);
        return lookup_error("invalid RSA public key: RSA key must be at least 2048 bits");
    }
    if (BN_num_bits(e_bn) <= 2 && BN_get_word(e_bn) < 3) {
        BN_free(n_bn);
        BN_free(e_bn);
        return lookup_error("invalid RSA public key: RSA exponent must be at least 3");
    }

    RSA* rsa = RSA_new();
    if (rsa == nullptr) {
        BN_free(n_bn);
        BN_free(e_bn);
        return lookup_error("failed to allocate RSA key");
    }

    // RSA takes ownership of n and e on success
    if (RSA_set0_key(rsa, n_bn, e_bn, nullptr) != 1) {
        RSA_free(rsa);
        BN_free(n_bn);
        BN_free(e_bn);
        return lookup_error("failed to set RSA key parameters");
    }

    EVP_PKEY* pkey = EVP_PKEY_new();
    if (pkey == nullptr) {
        RSA_free(rsa);
        return lookup_error("failed to allocate public key");
    }
    if (EVP_PKEY_assign_RSA(pkey, rsa) != 1) {
        EVP_PKEY_free(pkey);
        RSA_free(rsa);
        return lookup_error("failed to assign RSA key");
    }

    KeyLookup result;
    result.key = std::make_shared<const RsaPublicKey>(pkey);
    return result;
}

// ============================================================================
// JwkCache
// ============================================================================

JwkCache::JwkCache(JwkCacheConfig config) : config_(std::move(config)) {}

JwkCache::~JwkCache() {
    stop();
}

KeyLookup JwkCache::get_key(std::string_view kid) {
    std::string key_id(kid);

    {
        std::shared_lock lock(mutex_);
        if (Clock::now() < expires_at_) {
            auto it = keys_.find(key_id);
            if (it != keys_.end()) {
                return {it->second, {}};
            }
        }
    }

    Status refreshed = refresh();

    std::shared_lock lock(mutex_);
    auto it = keys_.find(key_id);
    if (it != keys_.end()) {
        if (!refreshed) {
            WARDEN_LOG_WARNING("JWK refresh failed, serving cached key kid={}: {}", key_id,
                               refreshed.error);
        }
        return {it->second, {}};
    }

    if (!refreshed) {
        return lookup_error("failed to fetch JWK set: " + refreshed.error);
    }
    return lookup_error("key ID " + key_id + " not found in JWK set");
}

Status JwkCache::refresh() {
    if (config_.endpoints.empty()) {
        return Status::failure(ErrorKind::Authentication, "no JWK endpoints configured");
    }

    std::string last_error;
    for (const auto& endpoint : config_.endpoints) {
        std::string body;
        if (auto status = http_get(endpoint, body); !status) {
            last_error = status.error;
            continue;
        }

        KeyMap keys;
        if (auto status = parse_jwks(body, keys); !status) {
            last_error = status.error;
            continue;
        }

        size_t count = keys.size();
        install(std::move(keys));
        WARDEN_LOG_DEBUG("Loaded {} JWK signing keys from {}", count, endpoint);
        return Status::success();
    }

    return Status::failure(ErrorKind::Authentication, last_error);
}

Status JwkCache::load_from_json(std::string_view jwks_json) {
    KeyMap keys;
    if (auto status = parse_jwks(jwks_json, keys); !status) {
        return status;
    }
    install(std::move(keys));
    return Status::success();
}

size_t JwkCache::key_count() const {
    std::shared_lock lock(mutex_);
    return keys_.size();
}

bool JwkCache::expired() const {
    std::shared_lock lock(mutex_);
    return Clock::now() >= expires_at_;
}

void JwkCache::install(KeyMap keys) {
    auto expires = Clock::now() + config_.ttl;
    std::unique_lock lock(mutex_);
    keys_ = std::move(keys);
    expires_at_ = expires;
}

Status JwkCache::http_get(const std::string& url, std::string& body) const {
    auto parsed = http::url::parse(url);
    if (!parsed || parsed->host.empty()) {
        return Status::failure(ErrorKind::Validation, "invalid JWK endpoint: " + url);
    }

    httplib::Client client(parsed->origin());
    client.set_connection_timeout(static_cast<time_t>(config_.timeout_seconds), 0);
    client.set_read_timeout(static_cast<time_t>(config_.timeout_seconds), 0);

    auto res = client.Get(parsed->path);
    if (!res) {
        return Status::failure(ErrorKind::Authentication,
                               "JWK request to " + url + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        return Status::failure(ErrorKind::Authentication,
                               "JWK endpoint returned status " + std::to_string(res->status));
    }

    body = std::move(res->body);
    return Status::success();
}

Status JwkCache::parse_jwks(std::string_view json, KeyMap& keys) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        return Status::failure(ErrorKind::Authentication,
                               std::string("failed to decode JWK set: ") + e.what());
    }

    // JWKS format: { "keys": [ {...}, {...} ] }
    if (!j.is_object() || !j.contains("keys") || !j["keys"].is_array()) {
        return Status::failure(ErrorKind::Authentication, "failed to decode JWK set: missing keys");
    }

    for (const auto& jwk_json : j["keys"]) {
        std::string kid = jwk_json.is_object() ? jwk_json.value("kid", "") : std::string{};
        auto parsed = parse_rsa_jwk(jwk_json.dump());
        if (!parsed) {
            WARDEN_LOG_WARNING("Skipping JWK kid={}: {}", kid, parsed.error);
            continue;
        }
        keys[kid] = std::move(parsed.key);
    }

    if (keys.empty()) {
        return Status::failure(ErrorKind::Authentication, "JWK set contains no usable RSA keys");
    }
    return Status::success();
}

void JwkCache::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    if (auto status = refresh(); !status) {
        WARDEN_LOG_WARNING("Initial JWK fetch failed: {}", status.error);
    }

    stop_token_ = core::CancellationToken::create();
    refresh_thread_ = std::make_unique<std::thread>(&JwkCache::refresh_loop, this, stop_token_);
}

void JwkCache::stop() {
    if (!running_.exchange(false)) {
        return;  // Not running
    }

    stop_token_->cancel();
    if (refresh_thread_ && refresh_thread_->joinable()) {
        refresh_thread_->join();
    }
    refresh_thread_.reset();
}

void JwkCache::refresh_loop(std::shared_ptr<core::CancellationToken> stop_token) {
    while (stop_token->wait_for(config_.ttl)) {
        if (auto status = refresh(); !status) {
            WARDEN_LOG_WARNING("Background JWK refresh failed: {}", status.error);
        }
    }
}

}  // namespace warden::auth
