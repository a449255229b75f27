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


// Warden IAP Token Verifier - Implementation

#include "jwt.hpp"

#include <openssl/evp.h>

#include <chrono>
#include <nlohmann/json.hpp>

#include "../core/base64.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace warden::auth {

namespace {

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

bool decode_claims(const std::string& payload, IapClaims& claims, std::string& error) {
    try {
        auto j = nlohmann::json::parse(payload);
        if (!j.is_object()) {
            error = "failed to parse JWT claims: not an object";
            return false;
        }
        claims.email = j.value("email", "");
        claims.issuer = j.value("iss", "");
        claims.audience = j.value("aud", "");
        claims.subject = j.value("sub", "");
        claims.issued_at = j.value("iat", int64_t{0});
        claims.expires_at = j.value("exp", int64_t{0});
        claims.hosted_domain = j.value("hd", "");
        claims.email_verified = j.value("email_verified", false);
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = std::string("failed to parse JWT claims: ") + e.what();
        return false;
    }
}

}  // namespace

IapTokenVerifier::IapTokenVerifier(std::shared_ptr<JwkCache> keys, bool allow_insecure_bypass)
    : keys_(std::move(keys)) {
#ifdef WARDEN_ALLOW_INSECURE_JWT_BYPASS
    allow_insecure_bypass_ = allow_insecure_bypass;
    if (allow_insecure_bypass_) {
        WARDEN_LOG_WARNING(
            "JWT signature verification bypass ENABLED (STRICT_JWT_VERIFICATION=false). "
            "This is insecure and must never be used in production");
    }
#else
    if (allow_insecure_bypass) {
        WARDEN_LOG_WARNING(
            "JWT signature verification bypass requested but not compiled in; verification "
            "stays strict");
    }
#endif
}

VerifyResult IapTokenVerifier::verify(std::string_view token, std::string_view audience) const {
    auto parts = core::split(token, '.');
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
        return VerifyResult::failure("invalid JWT format");
    }

    // Header
    auto header_json = core::base64url_decode(parts[0]);
    if (!header_json) {
        return VerifyResult::failure("failed to decode JWT header");
    }

    std::string alg;
    std::string kid;
    try {
        auto header = nlohmann::json::parse(*header_json);
        if (!header.is_object()) {
            return VerifyResult::failure("failed to parse JWT header: not an object");
        }
        alg = header.value("alg", "");
        kid = header.value("kid", "");
    } catch (const nlohmann::json::exception& e) {
        return VerifyResult::failure(std::string("failed to parse JWT header: ") + e.what());
    }

    if (alg != "RS256") {
        return VerifyResult::failure("unsupported JWT algorithm: " + alg);
    }

    // Claims
    auto payload_json = core::base64url_decode(parts[1]);
    if (!payload_json) {
        return VerifyResult::failure("failed to decode JWT claims");
    }

    IapClaims claims;
    std::string error;
    if (!decode_claims(*payload_json, claims, error)) {
        return VerifyResult::failure(std::move(error));
    }

    int64_t now = unix_now();
    if (claims.expires_at <= 0) {
        return VerifyResult::failure("missing exp claim");
    }
    if (now > claims.expires_at) {
        return VerifyResult::failure("JWT token has expired");
    }
    if (claims.issued_at > 0 && now < claims.issued_at) {
        return VerifyResult::failure("JWT token not yet valid");
    }

    if (claims.issuer != kIapIssuer && claims.issuer != kGoogleAccountsIssuer) {
        return VerifyResult::failure("invalid JWT issuer: " + claims.issuer);
    }

    if (!audience.empty() && claims.audience != audience) {
        return VerifyResult::failure("JWT audience mismatch: expected " + std::string(audience) +
                                     ", got " + claims.audience);
    }

    // Signature
    auto signature = core::base64url_decode(parts[2]);
    if (!signature) {
        return VerifyResult::failure("failed to decode JWT signature");
    }

    if (kid.empty()) {
        return VerifyResult::failure("JWT header missing key ID");
    }

    KeyLookup lookup;
    if (keys_) {
        lookup = keys_->get_key(kid);
    } else {
        lookup.error = "no key cache configured";
    }

    if (!lookup) {
        if (!allow_insecure_bypass_) {
            return VerifyResult::failure(
                "SECURITY: JWT signature verification required but public key fetch failed: " +
                lookup.error);
        }
        WARDEN_LOG_WARNING("JWT signature verification bypassed for kid={} (DEVELOPMENT ONLY): {}",
                           kid, lookup.error);
        auto result = VerifyResult::success(std::move(claims));
        result.signature_bypassed = true;
        return result;
    }

    std::string signing_input = parts[0] + "." + parts[1];
    if (!verify_rs256(*lookup.key, signing_input, *signature)) {
        return VerifyResult::failure("JWT signature verification failed");
    }

    return VerifyResult::success(std::move(claims));
}

bool verify_rs256(const RsaPublicKey& key, std::string_view message, std::string_view signature) {
    if (key.get() == nullptr || EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        return false;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        return false;
    }

    bool ok = EVP_DigestVerifyInit(ctx, nullptr, EVP_sha256(), nullptr, key.get()) == 1 &&
              EVP_DigestVerifyUpdate(ctx, message.data(), message.size()) == 1 &&
              EVP_DigestVerifyFinal(ctx, reinterpret_cast<const unsigned char*>(signature.data()),
                                    signature.size()) == 1;

    EVP_MD_CTX_free(ctx);
    return ok;
}

IapIdentity extract_iap_identity(const IapClaims& claims) {
    return {claims.email, claims.subject, claims.hosted_domain};
}

}  // namespace warden::auth
