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


// Warden Auth Extractor - Implementation

#include "auth_extractor.hpp"

#include <cstdlib>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "api_key_store.hpp"
#include "principal.hpp"
#include "role_sanitizer.hpp"

namespace warden::auth {

using core::ErrorKind;
using core::Status;

namespace {

Principal default_user(const std::string& id) {
    Principal principal;
    principal.id = id;
    principal.name = id;
    principal.roles = {"user"};
    principal.permissions = {Permission::Read, Permission::Execute};
    return principal;
}

bool strict_jwt_verification() {
    const char* value = std::getenv("STRICT_JWT_VERIFICATION");
    return value == nullptr || std::string_view(value) != "false";
}

}  // namespace

// ============================================================================
// AuthRequest
// ============================================================================

void AuthRequest::set_header(std::string_view name, std::string value) {
    headers_[core::to_lower(name)] = std::move(value);
}

std::string AuthRequest::header(std::string_view name) const {
    auto it = headers_.find(core::to_lower(name));
    return it != headers_.end() ? it->second : std::string{};
}

bool AuthRequest::has_header(std::string_view name) const {
    return headers_.contains(core::to_lower(name));
}

// ============================================================================
// Disabled
// ============================================================================

AuthResult DisabledAuthExtractor::extract(const AuthRequest& request) const {
    (void)request;

    Principal principal;
    principal.id = "anonymous";
    principal.name = "Anonymous User";
    principal.roles = {"anonymous"};
    principal.permissions = {Permission::Read};
    principal.metadata["auth_mode"] = "disabled";
    return AuthResult::success(std::move(principal));
}

// ============================================================================
// Delegated
// ============================================================================

DelegatedAuthExtractor::DelegatedAuthExtractor(control::DelegatedAuthConfig config,
                                               std::unique_ptr<IapTokenVerifier> verifier)
    : config_(std::move(config)), verifier_(std::move(verifier)) {
    if (config_.identity_header.empty()) {
        config_.identity_header = std::string(kIapIdentityHeader);
    }
}

AuthResult DelegatedAuthExtractor::extract(const AuthRequest& request) const {
    std::string identity = request.header(config_.identity_header);
    if (identity.empty()) {
        return AuthResult::failure("missing identity header: " + config_.identity_header);
    }

    if (config_.iap.enabled) {
        return extract_from_iap(request, identity);
    }
    return extract_from_headers(request, identity);
}

AuthResult DelegatedAuthExtractor::extract_from_iap(const AuthRequest& request,
                                                    const std::string& identity) const {
    // "accounts.google.com:user@example.com" or a bare email
    std::string email = identity;
    if (auto colon = identity.find(':'); colon != std::string::npos) {
        email = identity.substr(colon + 1);
    }

    IapIdentity verified;
    if (config_.iap.verify_jwt) {
        std::string assertion = request.header(kIapAssertionHeader);
        if (assertion.empty()) {
            return AuthResult::failure("missing IAP JWT assertion");
        }
        if (!verifier_) {
            return AuthResult::failure("JWT verification failed: no verifier configured");
        }

        auto result = verifier_->verify(assertion, config_.iap.audience);
        if (!result) {
            return AuthResult::failure("JWT verification failed: " + result.error);
        }

        verified = extract_iap_identity(result.claims);
        if (!verified.email.empty()) {
            email = verified.email;
        }
    }

    Principal principal = default_user(email);
    principal.metadata["auth_mode"] = "delegated_iap";
    principal.metadata["email"] = email;
    if (!verified.user_id.empty()) {
        principal.metadata["user_id"] = verified.user_id;
    }
    if (!verified.domain.empty()) {
        principal.metadata["domain"] = verified.domain;
    }

    for (const auto& [field, header_name] : config_.header_mapping) {
        std::string value = request.header(header_name);
        if (!value.empty()) {
            principal.metadata[field] = std::move(value);
        }
    }

    return AuthResult::success(std::move(principal));
}

AuthResult DelegatedAuthExtractor::extract_from_headers(const AuthRequest& request,
                                                        const std::string& identity) const {
    Principal principal = default_user(identity);
    principal.metadata["auth_mode"] = "delegated";

    for (const auto& [field, header_name] : config_.header_mapping) {
        std::string value = request.header(header_name);
        if (value.empty()) {
            continue;
        }

        if (field == "roles") {
            principal.roles = sanitize_roles(core::split(value, ','));
        } else if (field == "name") {
            principal.name = value;
        }
        principal.metadata[field] = std::move(value);
    }

    return AuthResult::success(std::move(principal));
}

// ============================================================================
// Builtin
// ============================================================================

BuiltinAuthExtractor::BuiltinAuthExtractor(std::string method,
                                           std::shared_ptr<const Authenticator> authenticator)
    : method_(std::move(method)), authenticator_(std::move(authenticator)) {}

AuthResult BuiltinAuthExtractor::extract(const AuthRequest& request) const {
    std::string header = request.header("Authorization");
    if (header.empty()) {
        return AuthResult::failure("missing Authorization header");
    }

    auto space = header.find(' ');
    if (space == std::string::npos) {
        return AuthResult::failure("invalid Authorization header format");
    }

    std::string scheme = core::to_lower(std::string_view(header).substr(0, space));
    std::string token = header.substr(space + 1);

    if (method_ == "api_key") {
        if (scheme != "bearer") {
            return AuthResult::failure("unsupported authentication scheme: " + scheme);
        }
    } else {
        return AuthResult::failure("unsupported builtin auth method: " + method_);
    }

    auto result = authenticator_->authenticate(token);
    if (!result) {
        return AuthResult::failure("authentication failed: " + result.error);
    }

    result.principal.metadata["auth_mode"] = "builtin";
    result.principal.metadata["auth_method"] = method_;
    return result;
}

// ============================================================================
// Hybrid
// ============================================================================

HybridAuthExtractor::HybridAuthExtractor(std::unique_ptr<DelegatedAuthExtractor> delegated,
                                         std::unique_ptr<BuiltinAuthExtractor> builtin)
    : delegated_(std::move(delegated)), builtin_(std::move(builtin)) {}

AuthResult HybridAuthExtractor::extract(const AuthRequest& request) const {
    auto result = delegated_->extract(request);
    std::string submode = "delegated";

    if (!result) {
        WARDEN_LOG_DEBUG("Hybrid auth: delegated failed ({}), trying builtin", result.error);
        result = builtin_->extract(request);
        submode = "builtin";
        if (!result) {
            WARDEN_LOG_DEBUG("Hybrid auth: builtin failed ({})", result.error);
            return AuthResult::failure("both delegated and builtin auth failed");
        }
    }

    result.principal.metadata["auth_mode"] = "hybrid";
    result.principal.metadata["auth_submode"] = submode;
    return result;
}

// ============================================================================
// Factory
// ============================================================================

std::shared_ptr<ApiKeyAuthenticator> create_api_key_authenticator(
    const control::ApiKeyConfig& config, Status& status) {
    std::vector<ApiKeyEntry> entries;

    if (config.source == "environment") {
        entries = load_api_keys_from_environment(config.env_prefix);
        if (entries.empty()) {
            WARDEN_LOG_WARNING("No API keys found in environment (prefix {})",
                               config.env_prefix.empty() ? kDefaultApiKeyEnvPrefix
                                                         : std::string_view(config.env_prefix));
        }
    } else if (config.source == "file") {
        if (config.file_path.empty()) {
            status = Status::failure(ErrorKind::Validation,
                                     "file_path is required for file-based API key source");
            return nullptr;
        }
        if (auto loaded = load_api_keys_from_file(config.file_path, entries); !loaded) {
            status = Status::failure(ErrorKind::Validation,
                                     "failed to load API keys from file: " + loaded.error);
            return nullptr;
        }
    } else {
        status = Status::failure(ErrorKind::Validation, "unsupported API key source: " + config.source);
        return nullptr;
    }

    auto authenticator = std::make_shared<ApiKeyAuthenticator>();
    for (auto& entry : entries) {
        authenticator->add_key(std::move(entry.key), std::move(entry.principal));
    }

    WARDEN_LOG_INFO("Loaded {} API keys from {}", authenticator->key_count(), config.source);
    status = Status::success();
    return authenticator;
}

namespace {

std::unique_ptr<DelegatedAuthExtractor> make_delegated(const control::SecurityConfig& config,
                                                       std::shared_ptr<JwkCache>& jwk_cache) {
    const auto& delegated = *config.delegated_auth;

    std::unique_ptr<IapTokenVerifier> verifier;
    if (delegated.iap.enabled && delegated.iap.verify_jwt) {
        bool bypass_requested = !strict_jwt_verification();
        bool allow_bypass = false;
        if (bypass_requested) {
            if (config.environment == control::kEnvProduction) {
                WARDEN_LOG_ERROR(
                    "STRICT_JWT_VERIFICATION=false ignored: signature bypass is never allowed in "
                    "production");
            } else {
                allow_bypass = true;
            }
        }

        if (!jwk_cache) {
            jwk_cache = std::make_shared<JwkCache>();
        }
        verifier = std::make_unique<IapTokenVerifier>(jwk_cache, allow_bypass);
    }

    return std::make_unique<DelegatedAuthExtractor>(delegated, std::move(verifier));
}

std::unique_ptr<BuiltinAuthExtractor> make_builtin(const control::BuiltinAuthConfig& builtin,
                                                   Status& status) {
    if (builtin.method != "api_key") {
        status = Status::failure(ErrorKind::Validation,
                                 "unsupported builtin auth method: " + builtin.method);
        return nullptr;
    }
    if (!builtin.api_keys) {
        status = Status::failure(ErrorKind::Validation,
                                 "api_keys configuration required for api_key method");
        return nullptr;
    }

    auto authenticator = create_api_key_authenticator(*builtin.api_keys, status);
    if (!authenticator) {
        status.error = "failed to create API key authenticator: " + status.error;
        return nullptr;
    }
    return std::make_unique<BuiltinAuthExtractor>(builtin.method, std::move(authenticator));
}

}  // namespace

ExtractorResult create_auth_extractor(const control::SecurityConfig& config,
                                      std::shared_ptr<JwkCache> jwk_cache) {
    ExtractorResult result;

    auto mode = control::parse_auth_mode(config.auth_mode);
    if (!mode) {
        result.status = Status::failure(ErrorKind::Validation,
                                        "unsupported auth mode: " + config.auth_mode);
        return result;
    }

    switch (*mode) {
        case control::AuthMode::Disabled:
            if (config.environment == control::kEnvProduction) {
                result.status = Status::failure(
                    ErrorKind::Validation,
                    "SECURITY ERROR: auth_mode=disabled is not allowed in production");
                return result;
            }
            WARDEN_LOG_WARNING("Authentication is DISABLED (environment={})", config.environment);
            result.extractor = std::make_unique<DisabledAuthExtractor>();
            break;

        case control::AuthMode::Delegated:
            if (!config.delegated_auth) {
                result.status = Status::failure(
                    ErrorKind::Validation, "auth_mode=delegated requires delegated_auth configuration");
                return result;
            }
            result.extractor = make_delegated(config, jwk_cache);
            break;

        case control::AuthMode::Builtin: {
            if (!config.builtin_auth) {
                result.status = Status::failure(
                    ErrorKind::Validation, "auth_mode=builtin requires builtin_auth configuration");
                return result;
            }
            auto builtin = make_builtin(*config.builtin_auth, result.status);
            if (!builtin) {
                return result;
            }
            result.extractor = std::move(builtin);
            break;
        }

        case control::AuthMode::Hybrid: {
            if (!config.delegated_auth || !config.builtin_auth) {
                result.status = Status::failure(
                    ErrorKind::Validation,
                    "auth_mode=hybrid requires both delegated_auth and builtin_auth configuration");
                return result;
            }
            auto builtin = make_builtin(*config.builtin_auth, result.status);
            if (!builtin) {
                return result;
            }
            result.extractor =
                std::make_unique<HybridAuthExtractor>(make_delegated(config, jwk_cache), std::move(builtin));
            break;
        }
    }

    WARDEN_LOG_INFO("Auth extractor ready: mode={}", result.extractor->mode());
    result.status = Status::success();
    return result;
}

Status authenticate_request(const AuthExtractor& extractor, const AuthRequest& request,
                            core::RequestContext& ctx) {
    const std::string& request_id = ctx.ensure_request_id();

    auto result = extractor.extract(request);
    if (!result) {
        WARDEN_LOG_AUTH(extractor.mode(), "-", "failure", request_id);
        WARDEN_LOG_DEBUG("Authentication failed: request_id={}, reason={}", request_id, result.error);
        return Status::failure(ErrorKind::Authentication, result.error);
    }

    auto auth = std::make_shared<AuthContext>();
    auth->session_id = result.principal.metadata_value("session_id");
    auth->client_ip = request.remote_addr;
    auth->user_agent = request.user_agent;
    auth->principal = std::move(result.principal);

    std::string principal_id = auth->principal.id;
    if (!ctx.attach_auth(std::move(auth))) {
        return Status::failure(ErrorKind::Internal, "auth context already attached");
    }

    WARDEN_LOG_AUTH(extractor.mode(), principal_id, "success", request_id);
    return Status::success();
}

}  // namespace warden::auth
