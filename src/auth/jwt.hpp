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


// Warden IAP Token Verifier - Header
// RS256 verification of identity-aware-proxy assertions

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "jwk_cache.hpp"

namespace warden::auth {

/// Issuers accepted for IAP assertions
inline constexpr std::string_view kIapIssuer = "https://cloud.google.com/iap";
inline constexpr std::string_view kGoogleAccountsIssuer = "https://accounts.google.com";

/// Claims carried by an IAP assertion
struct IapClaims {
    std::string email;
    std::string issuer;          // iss
    std::string audience;        // aud
    std::string subject;         // sub
    int64_t issued_at = 0;       // iat (unix seconds, 0 = absent)
    int64_t expires_at = 0;      // exp (unix seconds, required)
    std::string hosted_domain;   // hd
    bool email_verified = false;
};

/// Verification outcome
struct VerifyResult {
    bool valid = false;
    IapClaims claims;
    std::string error;
    bool signature_bypassed = false;  // Development override was used

    [[nodiscard]] static VerifyResult success(IapClaims claims) {
        VerifyResult result;
        result.valid = true;
        result.claims = std::move(claims);
        return result;
    }

    [[nodiscard]] static VerifyResult failure(std::string error) {
        VerifyResult result;
        result.error = std::move(error);
        return result;
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// Verifies compact RS256 tokens against keys from a shared JwkCache.
///
/// Order of checks: format, header (alg RS256, kid), claims decode, expiry,
/// not-before (iat), issuer, audience, signature. A failed key fetch fails
/// closed unless the development override is compiled in and enabled.
class IapTokenVerifier {
public:
    /// `allow_insecure_bypass` is ignored unless the build enables
    /// WARDEN_ALLOW_INSECURE_JWT_BYPASS
    explicit IapTokenVerifier(std::shared_ptr<JwkCache> keys, bool allow_insecure_bypass = false);

    /// `audience` is only compared when non-empty
    [[nodiscard]] VerifyResult verify(std::string_view token, std::string_view audience) const;

    [[nodiscard]] bool insecure_bypass_enabled() const noexcept { return allow_insecure_bypass_; }

private:
    std::shared_ptr<JwkCache> keys_;
    bool allow_insecure_bypass_ = false;
};

/// RSA PKCS#1 v1.5 / SHA-256 signature check over `message`
[[nodiscard]] bool verify_rs256(const RsaPublicKey& key, std::string_view message,
                                std::string_view signature);

/// Identity fields distilled from verified claims
struct IapIdentity {
    std::string email;
    std::string user_id;  // sub
    std::string domain;   // hd
};

[[nodiscard]] IapIdentity extract_iap_identity(const IapClaims& claims);

}  // namespace warden::auth
