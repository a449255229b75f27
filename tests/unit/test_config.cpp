// Warden Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include "control/config.hpp"
#include "control/config_validator.hpp"

using namespace warden::control;

namespace {

bool contains(const std::vector<std::string>& messages, const std::string& needle) {
    return std::any_of(messages.begin(), messages.end(), [&](const std::string& m) {
        return m.find(needle) != std::string::npos;
    });
}

constexpr const char* kProductionYaml = R"(
environment: production
auth_mode: builtin
builtin_auth:
  method: api_key
  api_keys:
    source: environment
    env_prefix: WARDEN_KEY_
authorization:
  enabled: true
  default_deny: true
audit:
  enabled: true
  backend: memory
rate_limit:
  requests_per_second: 50
  burst: 100
  tools:
    search:
      requests_per_second: 2
      burst: 4
timeouts:
  default_ms: 10000
  tools:
    search: 2500
prompt_injection:
  sensitivity: high
)";

}  // namespace

TEST_CASE("Config loads YAML", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_string(kProductionYaml, result);

    REQUIRE(config.has_value());
    REQUIRE_FALSE(result.has_errors());
    REQUIRE(result.warnings.empty());

    REQUIRE(config->environment == "production");
    REQUIRE(config->builtin_auth.has_value());
    REQUIRE(config->builtin_auth->api_keys->env_prefix == "WARDEN_KEY_");
    REQUIRE(config->audit.backend == "memory");
    REQUIRE(config->rate_limit.requests_per_second == 50.0);
    REQUIRE(config->rate_limit.tools.at("search").burst == 4);
    REQUIRE(config->timeouts.tools.at("search") == 2500);
    REQUIRE(config->prompt_injection.sensitivity == "high");

    SECTION("Unset sections keep their defaults") {
        REQUIRE_FALSE(config->delegated_auth.has_value());
        REQUIRE(config->circuit_breaker.max_failures == 5);
        REQUIRE(config->ssrf.block_private_ips);
        REQUIRE(config->logging.level == "info");
    }
}

TEST_CASE("Config loads JSON", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_string(
        R"({"environment": "development", "auth_mode": "disabled"})", result);

    REQUIRE(config.has_value());
    REQUIRE(contains(result.warnings, "authentication is disabled"));
}

TEST_CASE("Config rejects unsafe or incomplete settings", "[control][config]") {
    ValidationResult result;

    SECTION("Disabled auth in production") {
        auto config = ConfigLoader::load_from_string("auth_mode: disabled\n", result);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(contains(result.errors,
                         "SECURITY ERROR: auth_mode=disabled is not allowed in production"));
    }

    SECTION("Missing mode sections") {
        REQUIRE_FALSE(ConfigLoader::load_from_string("auth_mode: builtin\n", result));
        REQUIRE(contains(result.errors, "auth_mode=builtin requires builtin_auth configuration"));

        ValidationResult delegated;
        REQUIRE_FALSE(ConfigLoader::load_from_string("auth_mode: delegated\n", delegated));
        REQUIRE(contains(delegated.errors,
                         "auth_mode=delegated requires delegated_auth configuration"));
    }

    SECTION("Hybrid needs both sections") {
        auto config = ConfigLoader::load_from_string(R"(
auth_mode: hybrid
delegated_auth:
  identity_header: X-Forwarded-User
)",
                                                     result);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(contains(result.errors, "auth_mode=hybrid requires both delegated_auth and "
                                        "builtin_auth configuration"));
    }

    SECTION("Unknown names") {
        REQUIRE_FALSE(ConfigLoader::load_from_string(R"(
environment: qa
auth_mode: magic
logging:
  level: verbose
prompt_injection:
  sensitivity: extreme
)",
                                                     result));
        REQUIRE(contains(result.errors, "unknown environment: qa"));
        REQUIRE(contains(result.errors, "unknown auth_mode: magic"));
        REQUIRE(contains(result.errors, "unknown logging level: verbose"));
        REQUIRE(contains(result.errors, "unknown prompt_injection sensitivity: extreme"));
    }

    SECTION("Builtin key source") {
        REQUIRE_FALSE(ConfigLoader::load_from_string(R"(
auth_mode: builtin
builtin_auth:
  api_keys:
    source: file
)",
                                                     result));
        REQUIRE(contains(result.errors, "file_path is required for file-based API key source"));
    }

    SECTION("Audit backends") {
        REQUIRE_FALSE(ConfigLoader::load_from_string(R"(
environment: development
auth_mode: disabled
audit:
  enabled: true
  backend: splunk
  siem:
    batch_size: 0
    splunk:
      url: https://splunk.example.com:8088/services/collector
)",
                                                     result));
        REQUIRE(contains(result.errors, "siem.batch_size must be > 0"));
        REQUIRE(contains(result.errors, "splunk HEC token is required"));

        ValidationResult unknown;
        REQUIRE_FALSE(ConfigLoader::load_from_string(R"(
environment: development
auth_mode: disabled
audit:
  enabled: true
  backend: syslog
)",
                                                     unknown));
        REQUIRE(contains(unknown.errors, "unknown audit backend: syslog"));
    }

    SECTION("Backpressure bounds") {
        REQUIRE_FALSE(ConfigLoader::load_from_string(R"(
environment: development
auth_mode: disabled
rate_limit:
  requests_per_second: 0
  tools:
    search: {requests_per_second: 1, burst: 0}
circuit_breaker:
  max_failures: 0
)",
                                                     result));
        REQUIRE(contains(result.errors, "rate_limit.requests_per_second must be > 0"));
        REQUIRE(contains(result.errors, "rate_limit for tool 'search'"));
        REQUIRE(contains(result.errors, "circuit_breaker.max_failures must be > 0"));
    }

    SECTION("Malformed documents") {
        REQUIRE_FALSE(ConfigLoader::load_from_string("- just\n- a list\n", result));
        REQUIRE(contains(result.errors, "configuration root must be a mapping"));

        ValidationResult typed;
        REQUIRE_FALSE(ConfigLoader::load_from_string("rate_limit:\n  burst: lots\n", typed));
        REQUIRE(contains(typed.errors, "invalid configuration: "));
    }
}

TEST_CASE("ConfigValidator header names", "[control][config]") {
    REQUIRE(ConfigValidator::check_header_name("X-Goog-Authenticated-User-Email").empty());
    REQUIRE(ConfigValidator::check_header_name("") == "header name cannot be empty");
    REQUIRE(ConfigValidator::check_header_name("X-User\r\nInjected") ==
            "header name contains CR, LF or NUL at position 6");
    REQUIRE(ConfigValidator::check_header_name("X User") ==
            "invalid character at position 1 in header name");
    REQUIRE(ConfigValidator::check_header_name(std::string(257, 'x')) ==
            "header name too long (257 > 256 chars)");

    ValidationResult result;
    auto config = ConfigLoader::load_from_string(R"(
environment: staging
auth_mode: delegated
delegated_auth:
  identity_header: "X-User:"
  header_mapping:
    roles: "X Roles"
)",
                                                 result);
    REQUIRE_FALSE(config.has_value());
    REQUIRE(contains(result.errors, "delegated_auth.identity_header: invalid character"));
    REQUIRE(contains(result.errors, "delegated_auth.header_mapping.roles: invalid character"));
}

TEST_CASE("ConfigValidator hardening warnings", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_string(R"(
environment: production
auth_mode: delegated
delegated_auth:
  iap:
    enabled: true
    verify_jwt: false
authorization:
  enabled: true
  default_deny: false
audit:
  enabled: true
  backend: webhook
  siem:
    webhook:
      url: https://siem.example.com/ingest
      tls_verify: false
)",
                                                 result);

    REQUIRE(config.has_value());
    REQUIRE(contains(result.warnings, "delegated_auth.iap.verify_jwt is false"));
    REQUIRE(contains(result.warnings, "authorization.default_deny is false"));
    REQUIRE(contains(result.warnings, "siem.webhook.tls_verify is false"));

    SECTION("Production without authorization or audit") {
        ValidationResult bare;
        auto minimal = ConfigLoader::load_from_string(R"(
auth_mode: builtin
builtin_auth:
  api_keys: {}
)",
                                                      bare);
        REQUIRE(minimal.has_value());
        REQUIRE(contains(bare.warnings, "authorization is disabled in production"));
        REQUIRE(contains(bare.warnings, "audit logging is disabled in production"));
    }
}

TEST_CASE("Config defaults per environment", "[control][config]") {
    SECTION("Development") {
        auto config = default_security_config("development");
        REQUIRE(config.auth_mode == "disabled");
        REQUIRE_FALSE(config.audit.enabled);
        REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Production") {
        auto config = default_security_config("production");
        REQUIRE(config.auth_mode == "builtin");
        REQUIRE(config.builtin_auth->api_keys.has_value());
        REQUIRE(config.authorization.default_deny);
        REQUIRE(config.audit.log_auth_decisions);
        REQUIRE(ConfigValidator::validate(config).valid);
    }

    SECTION("Unknown environment falls back to production") {
        auto config = default_security_config("qa");
        REQUIRE(config.environment == "production");
    }

    SECTION("Staging") {
        REQUIRE(default_security_config("staging").environment == "staging");
    }
}

TEST_CASE("Config serialization and summary", "[control][config]") {
    auto config = default_security_config("development");

    std::string json = ConfigLoader::to_json(config);
    REQUIRE(json.find("\"auth_mode\": \"disabled\"") != std::string::npos);

    SECTION("Credentials are not serialized") {
        ElasticsearchConfig es;
        es.urls = {"https://es.example.com"};
        es.password = "hunter2";
        config.audit.siem = SiemConfig{};
        config.audit.siem->elasticsearch = es;
        REQUIRE(ConfigLoader::to_json(config).find("hunter2") == std::string::npos);
    }

    SECTION("Summary") {
        std::string summary = format_security_summary(config);
        REQUIRE(summary.find("Environment: development") != std::string::npos);
        REQUIRE(summary.find("WARNING: AUTHENTICATION IS DISABLED") != std::string::npos);

        auto production = default_security_config("production");
        std::string prod_summary = format_security_summary(production);
        REQUIRE(prod_summary.find("Audit Logging: true (backend=json)") != std::string::npos);
        REQUIRE(prod_summary.find("WARNING") == std::string::npos);
    }

    SECTION("Auth mode names") {
        REQUIRE(parse_auth_mode("hybrid") == AuthMode::Hybrid);
        REQUIRE_FALSE(parse_auth_mode("oauth").has_value());
        REQUIRE(to_string(AuthMode::Delegated) == "delegated");
    }
}

TEST_CASE("Config loads from file", "[control][config]") {
    auto path = std::filesystem::temp_directory_path() / "warden_config_test.yaml";
    {
        std::ofstream out(path);
        out << kProductionYaml;
    }

    ValidationResult result;
    auto config = ConfigLoader::load_from_file(path.string(), result);
    REQUIRE(config.has_value());
    REQUIRE(config->rate_limit.burst == 100);
    std::filesystem::remove(path);

    ValidationResult missing;
    REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/warden.yaml", missing));
    REQUIRE(missing.has_errors());
}
