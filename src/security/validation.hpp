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


// Warden Input Validation - Header
// Typed argument validators, injection pattern checks, path containment

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/status.hpp"
#include "../http/regex.hpp"

namespace warden::security {

/// Validator for a single tool argument (JSON value)
class ArgValidator {
public:
    virtual ~ArgValidator() = default;

    [[nodiscard]] virtual core::Status validate(const nlohmann::json& value) const = 0;
};

/// String constraints; checks run in declaration order
class StringValidator final : public ArgValidator {
public:
    std::optional<http::Regex> pattern;
    size_t min_length = 0;  // 0 = unchecked
    size_t max_length = 0;  // 0 = unchecked
    std::vector<std::string> allowed_values;
    bool disallow_null_bytes = false;
    bool disallow_control_chars = false;
    bool check_sql_injection = false;
    bool check_command_injection = false;
    bool check_xss = false;

    [[nodiscard]] core::Status validate(const nlohmann::json& value) const override;

    /// Validate a raw string (same rules)
    [[nodiscard]] core::Status validate_string(std::string_view str) const;
};

class IntValidator final : public ArgValidator {
public:
    std::optional<int64_t> min;
    std::optional<int64_t> max;

    [[nodiscard]] core::Status validate(const nlohmann::json& value) const override;
};

class FloatValidator final : public ArgValidator {
public:
    std::optional<double> min;
    std::optional<double> max;

    [[nodiscard]] core::Status validate(const nlohmann::json& value) const override;
};

/// Path resolution result
struct PathResult {
    bool valid = false;
    std::string path;
    std::string error;

    [[nodiscard]] static PathResult success(std::string path) {
        return {true, std::move(path), ""};
    }

    [[nodiscard]] static PathResult failure(std::string error) {
        return {false, "", std::move(error)};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// Normalize `path` and reject traversal. With a base directory the result is
/// absolute and must stay inside it.
[[nodiscard]] PathResult sanitize_file_path(std::string_view path, std::string_view base_dir = {});

/// Reject empty paths, NUL bytes and ".." traversal (audit file targets)
[[nodiscard]] core::Status validate_file_path(std::string_view path);

/// Remove NUL and control characters (newline, tab and CR are kept)
[[nodiscard]] std::string sanitize_string(std::string_view input);

/// Tool names: ^[a-zA-Z0-9_:-]+$, at most 100 characters
[[nodiscard]] core::Status validate_tool_name(std::string_view name);

/// Must be a JSON object with at most max_keys keys of bounded length
[[nodiscard]] core::Status validate_json_object(const nlohmann::json& value,
                                                size_t max_keys = 1000);

[[nodiscard]] bool contains_sql_injection(std::string_view input);
[[nodiscard]] bool contains_command_injection(std::string_view input);
[[nodiscard]] bool contains_xss(std::string_view input);

}  // namespace warden::security
