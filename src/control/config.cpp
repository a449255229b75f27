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


// Warden Configuration - Implementation

#include "config.hpp"

#include <fmt/format.h>

#include <cstdio>

#include "../core/logging.hpp"
#include "../security/prompt_injection.hpp"
#include "../security/safe_config_parser.hpp"
#include "config_validator.hpp"

namespace warden::control {

namespace {

bool is_known_environment(std::string_view environment) {
    return environment == kEnvProduction || environment == kEnvStaging ||
           environment == kEnvDevelopment;
}

bool is_known_audit_backend(std::string_view backend) {
    return backend == "memory" || backend == "json" || backend == "file" ||
           backend == "elasticsearch" || backend == "splunk" || backend == "webhook";
}

std::optional<SecurityConfig> decode(const security::ParseResult& parsed,
                                     ValidationResult& result) {
    if (!parsed) {
        result.add_error(parsed.error);
        return std::nullopt;
    }

    SecurityConfig config;
    try {
        if (!parsed.json.is_object()) {
            result.add_error("configuration root must be a mapping");
            return std::nullopt;
        }
        config = parsed.json.get<SecurityConfig>();
    } catch (const nlohmann::json::exception& e) {
        result.add_error(std::string("invalid configuration: ") + e.what());
        return std::nullopt;
    }

    auto validation = ConfigValidator::validate(config);
    for (auto& warning : validation.warnings) {
        result.add_warning(std::move(warning));
    }
    for (auto& error : validation.errors) {
        result.add_error(std::move(error));
    }

    if (result.has_errors()) {
        return std::nullopt;
    }
    return config;
}

void validate_builtin(const BuiltinAuthConfig& builtin, ValidationResult& result) {
    if (builtin.method != "api_key") {
        result.add_error("unsupported builtin auth method: " + builtin.method);
        return;
    }
    if (!builtin.api_keys) {
        result.add_error("api_keys configuration required for api_key method");
        return;
    }

    const auto& keys = *builtin.api_keys;
    if (keys.source == "file") {
        if (keys.file_path.empty()) {
            result.add_error("file_path is required for file-based API key source");
        }
    } else if (keys.source != "environment") {
        result.add_error("unsupported API key source: " + keys.source);
    }
}

void validate_audit(const AuditConfig& audit, ValidationResult& result) {
    if (!audit.enabled) {
        return;
    }

    if (!is_known_audit_backend(audit.backend)) {
        result.add_error("unknown audit backend: " + audit.backend);
        return;
    }

    if (audit.backend == "file" && audit.file_path.empty()) {
        result.add_error("audit backend file requires file_path");
    }

    bool is_siem = audit.backend == "elasticsearch" || audit.backend == "splunk" ||
                   audit.backend == "webhook";
    if (!is_siem) {
        return;
    }

    if (!audit.siem) {
        result.add_error("audit backend " + audit.backend + " requires siem configuration");
        return;
    }

    const auto& siem = *audit.siem;
    if (siem.batch_size == 0) {
        result.add_error("siem.batch_size must be > 0");
    }
    if (siem.flush_interval_ms == 0) {
        result.add_error("siem.flush_interval_ms must be > 0");
    }

    if (audit.backend == "elasticsearch") {
        if (!siem.elasticsearch) {
            result.add_error("audit backend elasticsearch requires siem.elasticsearch configuration");
        } else if (siem.elasticsearch->urls.empty()) {
            result.add_error("elasticsearch configuration with at least one URL is required");
        }
    } else if (audit.backend == "splunk") {
        if (!siem.splunk) {
            result.add_error("audit backend splunk requires siem.splunk configuration");
        } else {
            if (siem.splunk->url.empty()) {
                result.add_error("splunk configuration with URL is required");
            }
            if (siem.splunk->token.empty()) {
                result.add_error("splunk HEC token is required");
            }
        }
    } else if (audit.backend == "webhook") {
        if (!siem.webhook) {
            result.add_error("audit backend webhook requires siem.webhook configuration");
        } else if (siem.webhook->url.empty()) {
            result.add_error("webhook configuration with URL is required");
        }
    }
}

}  // namespace

std::optional<AuthMode> parse_auth_mode(std::string_view name) {
    if (name == "disabled") return AuthMode::Disabled;
    if (name == "delegated") return AuthMode::Delegated;
    if (name == "builtin") return AuthMode::Builtin;
    if (name == "hybrid") return AuthMode::Hybrid;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const SecurityConfig& c) {
    j = nlohmann::json{{"environment", c.environment},
                       {"auth_mode", c.auth_mode},
                       {"authorization", c.authorization},
                       {"audit", c.audit},
                       {"logging", c.logging},
                       {"ssrf", c.ssrf},
                       {"rate_limit", c.rate_limit},
                       {"circuit_breaker", c.circuit_breaker},
                       {"timeouts", c.timeouts},
                       {"prompt_injection", c.prompt_injection}};
    if (c.delegated_auth) {
        j["delegated_auth"] = *c.delegated_auth;
    }
    if (c.builtin_auth) {
        j["builtin_auth"] = *c.builtin_auth;
    }
}

// ConfigLoader implementation

std::optional<SecurityConfig> ConfigLoader::load_from_file(std::string_view path,
                                                           ValidationResult& result) {
    security::SafeConfigParser parser;
    return decode(parser.parse_file(std::string(path)), result);
}

std::optional<SecurityConfig> ConfigLoader::load_from_string(std::string_view text,
                                                             ValidationResult& result) {
    security::SafeConfigParser parser;
    return decode(parser.parse(text), result);
}

ValidationResult ConfigLoader::validate(const SecurityConfig& config) {
    ValidationResult result;

    if (!is_known_environment(config.environment)) {
        result.add_error("unknown environment: " + config.environment);
    }

    auto mode = parse_auth_mode(config.auth_mode);
    if (!mode) {
        result.add_error("unknown auth_mode: " + config.auth_mode);
    } else {
        switch (*mode) {
            case AuthMode::Disabled:
                if (config.environment == kEnvProduction) {
                    result.add_error(
                        "SECURITY ERROR: auth_mode=disabled is not allowed in production");
                } else {
                    result.add_warning("authentication is disabled");
                }
                break;
            case AuthMode::Delegated:
                if (!config.delegated_auth) {
                    result.add_error("auth_mode=delegated requires delegated_auth configuration");
                }
                break;
            case AuthMode::Builtin:
                if (!config.builtin_auth) {
                    result.add_error("auth_mode=builtin requires builtin_auth configuration");
                }
                break;
            case AuthMode::Hybrid:
                if (!config.delegated_auth || !config.builtin_auth) {
                    result.add_error(
                        "auth_mode=hybrid requires both delegated_auth and builtin_auth "
                        "configuration");
                }
                break;
        }
    }

    bool builtin_in_use = mode && (*mode == AuthMode::Builtin || *mode == AuthMode::Hybrid);
    if (builtin_in_use && config.builtin_auth) {
        validate_builtin(*config.builtin_auth, result);
    }

    validate_audit(config.audit, result);

    // Logging
    const auto& level = config.logging.level;
    if (level != "debug" && level != "info" && level != "warning" && level != "error") {
        result.add_error("unknown logging level: " + level);
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("unknown logging format: " + config.logging.format);
    }

    // Backpressure
    if (config.rate_limit.requests_per_second <= 0) {
        result.add_error("rate_limit.requests_per_second must be > 0");
    }
    if (config.rate_limit.burst == 0) {
        result.add_error("rate_limit.burst must be > 0");
    }
    for (const auto& [tool, limit] : config.rate_limit.tools) {
        if (limit.requests_per_second <= 0 || limit.burst == 0) {
            result.add_error("rate_limit for tool '" + tool + "' must have positive rate and burst");
        }
    }
    if (config.circuit_breaker.max_failures == 0) {
        result.add_error("circuit_breaker.max_failures must be > 0");
    }
    if (config.timeouts.default_ms == 0) {
        result.add_error("timeouts.default_ms must be > 0");
    }

    if (!security::parse_sensitivity(config.prompt_injection.sensitivity)) {
        result.add_error("unknown prompt_injection sensitivity: " +
                         config.prompt_injection.sensitivity);
    }

    if (config.ssrf.allowed_schemes.empty()) {
        result.add_error("ssrf.allowed_schemes must not be empty");
    }

    return result;
}

std::string ConfigLoader::to_json(const SecurityConfig& config) {
    nlohmann::json j = config;
    return j.dump(2);
}

// Defaults

SecurityConfig default_security_config(std::string_view environment) {
    SecurityConfig config;

    if (environment == kEnvDevelopment) {
        config.environment = std::string(kEnvDevelopment);
        config.auth_mode = "disabled";
        config.authorization.enabled = false;
        config.audit.enabled = false;
        return config;
    }

    if (environment == kEnvStaging) {
        config.environment = std::string(kEnvStaging);
    } else {
        if (environment != kEnvProduction) {
            WARDEN_LOG_WARNING("Unknown environment '{}', using production defaults", environment);
        }
        config.environment = std::string(kEnvProduction);
    }

    config.auth_mode = "builtin";
    config.builtin_auth = BuiltinAuthConfig{"api_key", ApiKeyConfig{}};
    config.authorization.enabled = true;
    config.authorization.default_deny = true;
    config.audit.enabled = true;
    config.audit.backend = "json";
    config.audit.log_auth_decisions = true;
    return config;
}

std::string format_security_summary(const SecurityConfig& config) {
    std::string out;
    out += "=== SECURITY CONFIGURATION ===\n";
    out += fmt::format("Environment: {}\n", config.environment);
    out += fmt::format("Auth Mode: {}\n", config.auth_mode);
    out += fmt::format("Authorization: {}\n", config.authorization.enabled);
    out += fmt::format("Audit Logging: {}", config.audit.enabled);
    if (config.audit.enabled) {
        out += fmt::format(" (backend={})", config.audit.backend);
    }
    out += "\n";
    out += fmt::format("Rate Limit: {} req/s, burst {}\n", config.rate_limit.requests_per_second,
                       config.rate_limit.burst);
    out += fmt::format("Prompt Injection Detection: {} ({})\n", config.prompt_injection.enabled,
                       config.prompt_injection.sensitivity);

    if (config.auth_mode == "disabled") {
        out += "WARNING: AUTHENTICATION IS DISABLED\n";
        out += "WARNING: This configuration is NOT suitable for production\n";
    }

    out += "==============================\n";
    return out;
}

void print_security_summary(const SecurityConfig& config) {
    std::string summary = format_security_summary(config);
    std::fputs(summary.c_str(), stdout);
    WARDEN_LOG_INFO("Security configuration: environment={}, auth_mode={}, authorization={}, audit={}",
                    config.environment, config.auth_mode, config.authorization.enabled,
                    config.audit.enabled);
}

}  // namespace warden::control
