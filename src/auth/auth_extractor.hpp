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


// Warden Auth Extractor - Header
// Turns inbound request headers into an authenticated principal

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "../control/config.hpp"
#include "../core/containers.hpp"
#include "../core/request_context.hpp"
#include "../core/status.hpp"
#include "authenticator.hpp"
#include "jwt.hpp"

namespace warden::auth {

// Headers set by the identity-aware proxy
inline constexpr std::string_view kIapIdentityHeader = "X-Goog-Authenticated-User-Email";
inline constexpr std::string_view kIapAssertionHeader = "X-Goog-IAP-JWT-Assertion";

/// Inbound request as seen by the extractors. Header names are
/// case-insensitive.
class AuthRequest {
public:
    void set_header(std::string_view name, std::string value);

    /// Header value, or empty when absent
    [[nodiscard]] std::string header(std::string_view name) const;

    [[nodiscard]] bool has_header(std::string_view name) const;

    std::string remote_addr;
    std::string user_agent;

private:
    core::fast_map<std::string, std::string> headers_;  // Lower-cased names
};

/// Authentication strategy selected from configuration
class AuthExtractor {
public:
    virtual ~AuthExtractor() = default;

    [[nodiscard]] virtual AuthResult extract(const AuthRequest& request) const = 0;

    /// Mode label for logs and audit metadata
    [[nodiscard]] virtual std::string_view mode() const noexcept = 0;
};

/// Anonymous read-only principal for every request (never admin)
class DisabledAuthExtractor final : public AuthExtractor {
public:
    [[nodiscard]] AuthResult extract(const AuthRequest& request) const override;
    [[nodiscard]] std::string_view mode() const noexcept override { return "disabled"; }
};

/// Identity asserted by a trusted front proxy, optionally backed by a
/// verified IAP assertion
class DelegatedAuthExtractor final : public AuthExtractor {
public:
    /// `verifier` is required when IAP JWT verification is enabled
    DelegatedAuthExtractor(control::DelegatedAuthConfig config,
                           std::unique_ptr<IapTokenVerifier> verifier);

    [[nodiscard]] AuthResult extract(const AuthRequest& request) const override;
    [[nodiscard]] std::string_view mode() const noexcept override { return "delegated"; }

private:
    [[nodiscard]] AuthResult extract_from_iap(const AuthRequest& request,
                                              const std::string& identity) const;

    [[nodiscard]] AuthResult extract_from_headers(const AuthRequest& request,
                                                  const std::string& identity) const;

    control::DelegatedAuthConfig config_;
    std::unique_ptr<IapTokenVerifier> verifier_;
};

/// Credentials checked by this service (Authorization: Bearer <api-key>)
class BuiltinAuthExtractor final : public AuthExtractor {
public:
    BuiltinAuthExtractor(std::string method, std::shared_ptr<const Authenticator> authenticator);

    [[nodiscard]] AuthResult extract(const AuthRequest& request) const override;
    [[nodiscard]] std::string_view mode() const noexcept override { return "builtin"; }

private:
    std::string method_;
    std::shared_ptr<const Authenticator> authenticator_;
};

/// Delegated first, builtin as fallback
class HybridAuthExtractor final : public AuthExtractor {
public:
    HybridAuthExtractor(std::unique_ptr<DelegatedAuthExtractor> delegated,
                        std::unique_ptr<BuiltinAuthExtractor> builtin);

    [[nodiscard]] AuthResult extract(const AuthRequest& request) const override;
    [[nodiscard]] std::string_view mode() const noexcept override { return "hybrid"; }

private:
    std::unique_ptr<DelegatedAuthExtractor> delegated_;
    std::unique_ptr<BuiltinAuthExtractor> builtin_;
};

/// Factory outcome
struct ExtractorResult {
    core::Status status;
    std::unique_ptr<AuthExtractor> extractor;

    [[nodiscard]] explicit operator bool() const noexcept { return status.ok; }
};

/// API key authenticator loaded from the configured key source
[[nodiscard]] std::shared_ptr<ApiKeyAuthenticator> create_api_key_authenticator(
    const control::ApiKeyConfig& config, core::Status& status);

/// Build the extractor for config.auth_mode. `jwk_cache` backs IAP assertion
/// verification; a default cache is created when it is null and one is needed.
///
/// The unverified-claims development override is enabled only when the build
/// defines WARDEN_ALLOW_INSECURE_JWT_BYPASS, STRICT_JWT_VERIFICATION=false is
/// set, and the environment is not production.
[[nodiscard]] ExtractorResult create_auth_extractor(const control::SecurityConfig& config,
                                                    std::shared_ptr<JwkCache> jwk_cache = nullptr);

/// Run `extractor` and attach the resulting AuthContext to `ctx`
[[nodiscard]] core::Status authenticate_request(const AuthExtractor& extractor,
                                                const AuthRequest& request,
                                                core::RequestContext& ctx);

}  // namespace warden::auth
