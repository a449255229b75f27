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


// Warden Configuration Validator - Header
// Security checks on top of ConfigLoader::validate

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "config.hpp"

namespace warden::control {

/// Longest accepted header name in identity or mapping configuration
inline constexpr size_t kMaxHeaderNameLength = 256;

/// Validation with strict security checks
class ConfigValidator {
public:
    /// ConfigLoader::validate plus header-name and hardening checks
    [[nodiscard]] static ValidationResult validate(const SecurityConfig& config);

    /// Empty when `name` is an acceptable HTTP header name, otherwise the reason
    [[nodiscard]] static std::string check_header_name(std::string_view name);

private:
    /// Identity header and header_mapping entries
    static void validate_header_names(const SecurityConfig& config, ValidationResult& result);

    /// TLS-verify-off, default-deny-off and unverified IAP warnings
    static void validate_hardening(const SecurityConfig& config, ValidationResult& result);
};

}  // namespace warden::control
