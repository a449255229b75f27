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


// Warden - Main Entry Point
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>

#include "audit/audit_logger.hpp"
#include "auth/auth_extractor.hpp"
#include "control/config.hpp"
#include "core/logging.hpp"
#include "gateway/circuit_breaker.hpp"
#include "gateway/rate_limit.hpp"
#include "gateway/timeout_manager.hpp"
#include "security/prompt_injection.hpp"
#include "security/ssrf_validator.hpp"

namespace {

void print_validation(const warden::control::ValidationResult& validation) {
    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    if (!validation.warnings.empty()) {
        fprintf(stderr, "Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            fprintf(stderr, "  - %s\n", warning.c_str());
        }
    }
}

bool start_logging(const warden::control::LogConfig& config) {
    warden::logging::init_logging_system();
    try {
        return warden::logging::init_logger("warden", config) != nullptr;
    } catch (const std::filesystem::filesystem_error& e) {
        fprintf(stderr, "WARNING: cannot use log directory %s (%s), falling back to %s\n",
                config.output.c_str(), e.what(),
                (std::filesystem::temp_directory_path() / "warden").c_str());
    }

    warden::control::LogConfig fallback = config;
    fallback.output = (std::filesystem::temp_directory_path() / "warden").string();
    try {
        return warden::logging::init_logger("warden", fallback) != nullptr;
    } catch (const std::filesystem::filesystem_error& e) {
        fprintf(stderr, "ERROR: logging unavailable: %s\n", e.what());
        return false;
    }
}

// Build every component once from config to prove the wiring
int build_components(const warden::control::SecurityConfig& config) {
    using namespace warden;

    auto extractor = auth::create_auth_extractor(config);
    if (!extractor) {
        fprintf(stderr, "ERROR: auth setup failed: %s\n", extractor.status.error.c_str());
        return EXIT_FAILURE;
    }

    core::Status status;
    auto audit_logger = audit::create_audit_logger(config.audit, status);
    if (!audit_logger) {
        fprintf(stderr, "ERROR: audit setup failed: %s\n", status.error.c_str());
        return EXIT_FAILURE;
    }

    gateway::RateLimiter limiter(config.rate_limit.requests_per_second, config.rate_limit.burst);
    gateway::ToolRateLimiter tool_limiter;
    for (const auto& [tool, limit] : config.rate_limit.tools) {
        tool_limiter.set_tool_limit(tool, limit.requests_per_second, limit.burst);
    }

    gateway::CircuitBreaker breaker(gateway::CircuitBreakerConfig{
        config.circuit_breaker.max_failures, config.circuit_breaker.reset_timeout_ms, "downstream"});

    gateway::TimeoutManager timeouts(std::chrono::milliseconds(config.timeouts.default_ms));
    for (const auto& [tool, ms] : config.timeouts.tools) {
        timeouts.set_tool_timeout(tool, std::chrono::milliseconds(ms));
    }

    security::SsrfValidator ssrf(config.ssrf);
    auto sensitivity = security::parse_sensitivity(config.prompt_injection.sensitivity)
                           .value_or(security::Sensitivity::Medium);
    security::PromptInjectionDetector detector(sensitivity);

    printf("Components ready: auth=%.*s, audit backends=%zu, prompt patterns=%zu\n",
           static_cast<int>(extractor.extractor->mode().size()), extractor.extractor->mode().data(),
           audit_logger->backend_count(), detector.pattern_count());
    WARDEN_LOG_INFO("Warden components initialised: auth_mode={}, audit_backends={}",
                    extractor.extractor->mode(), audit_logger->backend_count());

    if (auto closed = audit_logger->close(); !closed) {
        fprintf(stderr, "WARNING: audit close failed: %s\n", closed.error.c_str());
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    printf("Warden security mediation layer v0.1.0\n\n");

    if (argc < 2) {
        fprintf(stderr, "Usage: %s <config.yaml|config.json>\n\n", argv[0]);
        auto defaults = warden::control::default_security_config(warden::control::kEnvDevelopment);
        printf("Development defaults:\n");
        warden::control::print_security_summary(defaults);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[1];
    printf("Loading configuration from %s...\n", config_path.c_str());

    warden::control::ValidationResult validation;
    auto config = warden::control::ConfigLoader::load_from_file(config_path, validation);
    if (!config || validation.has_errors()) {
        fprintf(stderr, "Failed to load configuration\n");
        print_validation(validation);
        return EXIT_FAILURE;
    }
    print_validation(validation);

    if (!start_logging(config->logging)) {
        return EXIT_FAILURE;
    }

    warden::control::print_security_summary(*config);

    int rc = build_components(*config);
    warden::logging::shutdown_logging();
    return rc;
}
