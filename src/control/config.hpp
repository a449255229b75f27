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


// Warden Configuration - Header
// Security configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../security/ssrf_validator.hpp"

namespace warden::security {

inline void from_json(const nlohmann::json& j, SsrfConfig& c) {
    c.allowed_hosts = j.value("allowed_hosts", std::vector<std::string>{});
    c.allowed_schemes = j.value("allowed_schemes", std::vector<std::string>{"http", "https"});
    c.allow_localhost = j.value("allow_localhost", true);
    c.block_private_ips = j.value("block_private_ips", true);
    c.block_metadata = j.value("block_metadata", true);
    c.block_link_local = j.value("block_link_local", true);
}

inline void to_json(nlohmann::json& j, const SsrfConfig& c) {
    j = nlohmann::json{{"allowed_hosts", c.allowed_hosts},
                       {"allowed_schemes", c.allowed_schemes},
                       {"allow_localhost", c.allow_localhost},
                       {"block_private_ips", c.block_private_ips},
                       {"block_metadata", c.block_metadata},
                       {"block_link_local", c.block_link_local}};
}

}  // namespace warden::security

namespace warden::control {

// Environment names
inline constexpr std::string_view kEnvProduction = "production";
inline constexpr std::string_view kEnvStaging = "staging";
inline constexpr std::string_view kEnvDevelopment = "development";

/// Authentication strategy selected by auth_mode
enum class AuthMode : uint8_t { Disabled, Delegated, Builtin, Hybrid };

[[nodiscard]] constexpr std::string_view to_string(AuthMode mode) noexcept {
    switch (mode) {
        case AuthMode::Disabled:
            return "disabled";
        case AuthMode::Delegated:
            return "delegated";
        case AuthMode::Builtin:
            return "builtin";
        case AuthMode::Hybrid:
            return "hybrid";
    }
    return "unknown";
}

[[nodiscard]] std::optional<AuthMode> parse_auth_mode(std::string_view name);

/// Logging configuration
struct LogConfig {
    std::string level = "info";              // debug, info, warning, error
    std::string format = "json";             // json, text
    std::string output = "/var/log/warden";  // Log directory (<name>.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Identity-aware proxy settings
struct IapConfig {
    bool enabled = false;
    bool verify_jwt = true;  // Require and verify X-Goog-IAP-JWT-Assertion
    std::string audience;    // Expected aud claim (empty = not checked)
};

/// Identity asserted by a trusted front proxy
struct DelegatedAuthConfig {
    std::string identity_header = "X-Goog-Authenticated-User-Email";
    IapConfig iap;
    std::map<std::string, std::string> header_mapping;  // field -> header name
};

/// Where API keys come from
struct ApiKeyConfig {
    std::string source = "environment";  // environment, file
    std::string file_path;
    std::string env_prefix = "AIXGO_API_KEY_";
};

/// Credentials verified by this service
struct BuiltinAuthConfig {
    std::string method = "api_key";
    std::optional<ApiKeyConfig> api_keys;
};

struct AuthorizationConfig {
    bool enabled = false;
    bool default_deny = true;
    std::string policy_file;
};

struct ElasticsearchConfig {
    std::vector<std::string> urls;
    std::string index = "audit-logs";
    std::string username;
    std::string password;
    bool tls_verify = true;
};

struct SplunkConfig {
    std::string url;  // HEC endpoint
    std::string token;
    std::string index;
    std::string source;
    bool tls_verify = true;
};

struct WebhookConfig {
    std::string url;
    std::string method = "POST";
    std::map<std::string, std::string> headers;
    bool tls_verify = true;
};

/// SIEM delivery (one section per backend type)
struct SiemConfig {
    std::optional<ElasticsearchConfig> elasticsearch;
    std::optional<SplunkConfig> splunk;
    std::optional<WebhookConfig> webhook;
    uint32_t batch_size = 100;
    uint32_t flush_interval_ms = 5000;
};

struct AuditConfig {
    bool enabled = false;
    std::string backend = "json";  // memory, json, file, elasticsearch, splunk, webhook
    bool log_auth_decisions = false;
    std::string file_path;  // For backend=file
    std::optional<SiemConfig> siem;
};

struct ToolRateLimit {
    double requests_per_second = 1.0;
    uint32_t burst = 1;
};

struct RateLimitConfig {
    double requests_per_second = 10.0;
    uint32_t burst = 20;
    std::map<std::string, ToolRateLimit> tools;
};

struct CircuitBreakerSettings {
    uint32_t max_failures = 5;
    uint32_t reset_timeout_ms = 30000;
};

struct TimeoutConfig {
    uint32_t default_ms = 30000;
    std::map<std::string, uint32_t> tools;
};

struct PromptInjectionConfig {
    bool enabled = true;
    std::string sensitivity = "medium";  // low, medium, high
};

/// Full security configuration (loaded once at startup, never mutated)
struct SecurityConfig {
    std::string environment = "production";
    std::string auth_mode = "builtin";
    std::optional<DelegatedAuthConfig> delegated_auth;
    std::optional<BuiltinAuthConfig> builtin_auth;
    AuthorizationConfig authorization;
    AuditConfig audit;

    LogConfig logging;
    security::SsrfConfig ssrf;
    RateLimitConfig rate_limit;
    CircuitBreakerSettings circuit_breaker;
    TimeoutConfig timeouts;
    PromptInjectionConfig prompt_injection;
};

// All config types use custom from_json/to_json (no macros)

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/warden"));
    l.rotation = j.value("rotation", LogConfig::RotationConfig{});
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, IapConfig& c) {
    c.enabled = j.value("enabled", false);
    c.verify_jwt = j.value("verify_jwt", true);
    c.audience = j.value("audience", std::string());
}

inline void to_json(nlohmann::json& j, const IapConfig& c) {
    j = nlohmann::json{{"enabled", c.enabled}, {"verify_jwt", c.verify_jwt}, {"audience", c.audience}};
}

inline void from_json(const nlohmann::json& j, DelegatedAuthConfig& c) {
    c.identity_header =
        j.value("identity_header", std::string("X-Goog-Authenticated-User-Email"));
    c.iap = j.value("iap", IapConfig{});
    c.header_mapping = j.value("header_mapping", std::map<std::string, std::string>{});
}

inline void to_json(nlohmann::json& j, const DelegatedAuthConfig& c) {
    j = nlohmann::json{{"identity_header", c.identity_header},
                       {"iap", c.iap},
                       {"header_mapping", c.header_mapping}};
}

inline void from_json(const nlohmann::json& j, ApiKeyConfig& c) {
    c.source = j.value("source", std::string("environment"));
    c.file_path = j.value("file_path", std::string());
    c.env_prefix = j.value("env_prefix", std::string("AIXGO_API_KEY_"));
}

inline void to_json(nlohmann::json& j, const ApiKeyConfig& c) {
    j = nlohmann::json{{"source", c.source}, {"file_path", c.file_path}, {"env_prefix", c.env_prefix}};
}

inline void from_json(const nlohmann::json& j, BuiltinAuthConfig& c) {
    c.method = j.value("method", std::string("api_key"));
    if (j.contains("api_keys") && !j.at("api_keys").is_null()) {
        c.api_keys = j.at("api_keys").get<ApiKeyConfig>();
    }
}

inline void to_json(nlohmann::json& j, const BuiltinAuthConfig& c) {
    j = nlohmann::json{{"method", c.method}};
    if (c.api_keys) {
        j["api_keys"] = *c.api_keys;
    }
}

inline void from_json(const nlohmann::json& j, AuthorizationConfig& c) {
    c.enabled = j.value("enabled", false);
    c.default_deny = j.value("default_deny", true);
    c.policy_file = j.value("policy_file", std::string());
}

inline void to_json(nlohmann::json& j, const AuthorizationConfig& c) {
    j = nlohmann::json{
        {"enabled", c.enabled}, {"default_deny", c.default_deny}, {"policy_file", c.policy_file}};
}

inline void from_json(const nlohmann::json& j, ElasticsearchConfig& c) {
    c.urls = j.value("urls", std::vector<std::string>{});
    c.index = j.value("index", std::string("audit-logs"));
    c.username = j.value("username", std::string());
    c.password = j.value("password", std::string());
    c.tls_verify = j.value("tls_verify", true);
}

// Credentials are never serialized back out
inline void to_json(nlohmann::json& j, const ElasticsearchConfig& c) {
    j = nlohmann::json{
        {"urls", c.urls}, {"index", c.index}, {"username", c.username}, {"tls_verify", c.tls_verify}};
}

inline void from_json(const nlohmann::json& j, SplunkConfig& c) {
    c.url = j.value("url", std::string());
    c.token = j.value("token", std::string());
    c.index = j.value("index", std::string());
    c.source = j.value("source", std::string());
    c.tls_verify = j.value("tls_verify", true);
}

inline void to_json(nlohmann::json& j, const SplunkConfig& c) {
    j = nlohmann::json{
        {"url", c.url}, {"index", c.index}, {"source", c.source}, {"tls_verify", c.tls_verify}};
}

inline void from_json(const nlohmann::json& j, WebhookConfig& c) {
    c.url = j.value("url", std::string());
    c.method = j.value("method", std::string("POST"));
    c.headers = j.value("headers", std::map<std::string, std::string>{});
    c.tls_verify = j.value("tls_verify", true);
}

inline void to_json(nlohmann::json& j, const WebhookConfig& c) {
    j = nlohmann::json{{"url", c.url}, {"method", c.method}, {"tls_verify", c.tls_verify}};
}

inline void from_json(const nlohmann::json& j, SiemConfig& c) {
    if (j.contains("elasticsearch") && !j.at("elasticsearch").is_null()) {
        c.elasticsearch = j.at("elasticsearch").get<ElasticsearchConfig>();
    }
    if (j.contains("splunk") && !j.at("splunk").is_null()) {
        c.splunk = j.at("splunk").get<SplunkConfig>();
    }
    if (j.contains("webhook") && !j.at("webhook").is_null()) {
        c.webhook = j.at("webhook").get<WebhookConfig>();
    }
    c.batch_size = j.value("batch_size", 100u);
    c.flush_interval_ms = j.value("flush_interval_ms", 5000u);
}

inline void to_json(nlohmann::json& j, const SiemConfig& c) {
    j = nlohmann::json{{"batch_size", c.batch_size}, {"flush_interval_ms", c.flush_interval_ms}};
    if (c.elasticsearch) {
        j["elasticsearch"] = *c.elasticsearch;
    }
    if (c.splunk) {
        j["splunk"] = *c.splunk;
    }
    if (c.webhook) {
        j["webhook"] = *c.webhook;
    }
}

inline void from_json(const nlohmann::json& j, AuditConfig& c) {
    c.enabled = j.value("enabled", false);
    c.backend = j.value("backend", std::string("json"));
    c.log_auth_decisions = j.value("log_auth_decisions", false);
    c.file_path = j.value("file_path", std::string());
    if (j.contains("siem") && !j.at("siem").is_null()) {
        c.siem = j.at("siem").get<SiemConfig>();
    }
}

inline void to_json(nlohmann::json& j, const AuditConfig& c) {
    j = nlohmann::json{{"enabled", c.enabled},
                       {"backend", c.backend},
                       {"log_auth_decisions", c.log_auth_decisions},
                       {"file_path", c.file_path}};
    if (c.siem) {
        j["siem"] = *c.siem;
    }
}

inline void from_json(const nlohmann::json& j, ToolRateLimit& t) {
    t.requests_per_second = j.value("requests_per_second", 1.0);
    t.burst = j.value("burst", 1u);
}

inline void to_json(nlohmann::json& j, const ToolRateLimit& t) {
    j = nlohmann::json{{"requests_per_second", t.requests_per_second}, {"burst", t.burst}};
}

inline void from_json(const nlohmann::json& j, RateLimitConfig& r) {
    r.requests_per_second = j.value("requests_per_second", 10.0);
    r.burst = j.value("burst", 20u);
    if (j.contains("tools")) {
        j.at("tools").get_to(r.tools);
    }
}

inline void to_json(nlohmann::json& j, const RateLimitConfig& r) {
    j = nlohmann::json{
        {"requests_per_second", r.requests_per_second}, {"burst", r.burst}, {"tools", r.tools}};
}

inline void from_json(const nlohmann::json& j, CircuitBreakerSettings& c) {
    c.max_failures = j.value("max_failures", 5u);
    c.reset_timeout_ms = j.value("reset_timeout_ms", 30000u);
}

inline void to_json(nlohmann::json& j, const CircuitBreakerSettings& c) {
    j = nlohmann::json{{"max_failures", c.max_failures}, {"reset_timeout_ms", c.reset_timeout_ms}};
}

inline void from_json(const nlohmann::json& j, TimeoutConfig& t) {
    t.default_ms = j.value("default_ms", 30000u);
    t.tools = j.value("tools", std::map<std::string, uint32_t>{});
}

inline void to_json(nlohmann::json& j, const TimeoutConfig& t) {
    j = nlohmann::json{{"default_ms", t.default_ms}, {"tools", t.tools}};
}

inline void from_json(const nlohmann::json& j, PromptInjectionConfig& p) {
    p.enabled = j.value("enabled", true);
    p.sensitivity = j.value("sensitivity", std::string("medium"));
}

inline void to_json(nlohmann::json& j, const PromptInjectionConfig& p) {
    j = nlohmann::json{{"enabled", p.enabled}, {"sensitivity", p.sensitivity}};
}

inline void from_json(const nlohmann::json& j, SecurityConfig& c) {
    c.environment = j.value("environment", std::string("production"));
    c.auth_mode = j.value("auth_mode", std::string("builtin"));

    // Optional sections - contains() keeps absent sections disengaged
    if (j.contains("delegated_auth") && !j.at("delegated_auth").is_null()) {
        c.delegated_auth = j.at("delegated_auth").get<DelegatedAuthConfig>();
    }
    if (j.contains("builtin_auth") && !j.at("builtin_auth").is_null()) {
        c.builtin_auth = j.at("builtin_auth").get<BuiltinAuthConfig>();
    }
    if (j.contains("authorization")) {
        j.at("authorization").get_to(c.authorization);
    }
    if (j.contains("audit")) {
        j.at("audit").get_to(c.audit);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("ssrf")) {
        j.at("ssrf").get_to(c.ssrf);
    }
    if (j.contains("rate_limit")) {
        j.at("rate_limit").get_to(c.rate_limit);
    }
    if (j.contains("circuit_breaker")) {
        j.at("circuit_breaker").get_to(c.circuit_breaker);
    }
    if (j.contains("timeouts")) {
        j.at("timeouts").get_to(c.timeouts);
    }
    if (j.contains("prompt_injection")) {
        j.at("prompt_injection").get_to(c.prompt_injection);
    }
}

void to_json(nlohmann::json& j, const SecurityConfig& c);

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load a YAML or JSON file through SafeConfigParser. Parse and
    /// validation errors are written to `result`; nullopt when any occurred.
    [[nodiscard]] static std::optional<SecurityConfig> load_from_file(std::string_view path,
                                                                      ValidationResult& result);

    /// Load from YAML or JSON text
    [[nodiscard]] static std::optional<SecurityConfig> load_from_string(std::string_view text,
                                                                        ValidationResult& result);

    /// Structural and security checks
    [[nodiscard]] static ValidationResult validate(const SecurityConfig& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const SecurityConfig& config);
};

/// Secure defaults per environment. Unknown environments fall back to
/// production settings with a warning.
[[nodiscard]] SecurityConfig default_security_config(std::string_view environment);

/// Human-readable summary of the effective security posture
[[nodiscard]] std::string format_security_summary(const SecurityConfig& config);

/// Print format_security_summary() to stdout
void print_security_summary(const SecurityConfig& config);

}  // namespace warden::control
