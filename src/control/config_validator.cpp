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


// Warden Configuration Validator - Implementation

#include "config_validator.hpp"

#include <cctype>

namespace warden::control {

namespace {

// RFC 7230 token characters
bool is_header_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
        case '!':
        case '#':
        case '$':
        case '%':
        case '&':
        case '\'':
        case '*':
        case '+':
        case '-':
        case '.':
        case '^':
        case '_':
        case '`':
        case '|':
        case '~':
            return true;
        default:
            return false;
    }
}

}  // namespace

ValidationResult ConfigValidator::validate(const SecurityConfig& config) {
    ValidationResult result = ConfigLoader::validate(config);
    validate_header_names(config, result);
    validate_hardening(config, result);
    return result;
}

std::string ConfigValidator::check_header_name(std::string_view name) {
    if (name.empty()) {
        return "header name cannot be empty";
    }
    if (name.size() > kMaxHeaderNameLength) {
        return "header name too long (" + std::to_string(name.size()) + " > " +
               std::to_string(kMaxHeaderNameLength) + " chars)";
    }

    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '\r' || c == '\n' || c == '\0') {
            return "header name contains CR, LF or NUL at position " + std::to_string(i);
        }
        if (!is_header_char(c)) {
            return "invalid character at position " + std::to_string(i) + " in header name";
        }
    }
    return {};
}

void ConfigValidator::validate_header_names(const SecurityConfig& config,
                                            ValidationResult& result) {
    if (!config.delegated_auth) {
        return;
    }

    const auto& delegated = *config.delegated_auth;
    if (auto error = check_header_name(delegated.identity_header); !error.empty()) {
        result.add_error("delegated_auth.identity_header: " + error);
    }

    for (const auto& [field, header] : delegated.header_mapping) {
        if (field.empty()) {
            result.add_error("delegated_auth.header_mapping: field name cannot be empty");
        }
        if (auto error = check_header_name(header); !error.empty()) {
            result.add_error("delegated_auth.header_mapping." + field + ": " + error);
        }
    }
}

void ConfigValidator::validate_hardening(const SecurityConfig& config, ValidationResult& result) {
    bool production = config.environment == kEnvProduction;

    if (config.delegated_auth && config.delegated_auth->iap.enabled &&
        !config.delegated_auth->iap.verify_jwt) {
        result.add_warning(
            "delegated_auth.iap.verify_jwt is false: identity headers are trusted without "
            "signature verification");
    }

    if (config.authorization.enabled && !config.authorization.default_deny) {
        result.add_warning("authorization.default_deny is false");
    }
    if (production && !config.authorization.enabled) {
        result.add_warning("authorization is disabled in production");
    }
    if (production && !config.audit.enabled) {
        result.add_warning("audit logging is disabled in production");
    }

    if (config.audit.siem) {
        const auto& siem = *config.audit.siem;
        if (siem.elasticsearch && !siem.elasticsearch->tls_verify) {
            result.add_warning("siem.elasticsearch.tls_verify is false");
        }
        if (siem.splunk && !siem.splunk->tls_verify) {
            result.add_warning("siem.splunk.tls_verify is false");
        }
        if (siem.webhook && !siem.webhook->tls_verify) {
            result.add_warning("siem.webhook.tls_verify is false");
        }
    }
}

}  // namespace warden::control
