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


// Warden Input Validation - Implementation

#include "validation.hpp"

#include <array>
#include <filesystem>

#include <fmt/format.h>

#include "../core/string_utils.hpp"

namespace warden::security {

using core::ErrorKind;
using core::Status;

namespace {

constexpr size_t kMaxToolNameLength = 100;
constexpr size_t kMaxJsonKeyLength = 256;

Status invalid(std::string error) {
    return Status::failure(ErrorKind::Validation, std::move(error));
}

std::string_view json_type_name(const nlohmann::json& value) {
    return value.type_name();
}

}  // namespace

// ============================================================================
// Pattern checks
// ============================================================================

bool contains_sql_injection(std::string_view input) {
    std::string lower = core::to_lower(input);

    static constexpr std::array<std::string_view, 12> kPatterns{
        "' or '1'='1", "' or 1=1", "\" or \"1\"=\"1", "\" or 1=1",
        "'; drop",     "\"; drop", "' union",        "\" union",
        "'--",         "\"--",     "';--",           "\";--",
    };
    for (auto pattern : kPatterns) {
        if (lower.find(pattern) != std::string::npos) {
            return true;
        }
    }

    // SQL keywords after a quote
    size_t quote = lower.find('\'');
    if (quote != std::string::npos) {
        std::string_view remaining = std::string_view(lower).substr(quote);
        for (std::string_view kw :
             {"select", "insert", "update", "delete", "drop", "union", "exec", "execute"}) {
            if (remaining.find(kw) != std::string_view::npos) {
                return true;
            }
        }
    }

    return false;
}

bool contains_command_injection(std::string_view input) {
    static constexpr std::array<std::string_view, 9> kPatterns{
        ";", "&&", "||", "|", "`", "$(", "${", "\n", ">",
    };
    for (auto pattern : kPatterns) {
        if (input.find(pattern) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

bool contains_xss(std::string_view input) {
    std::string lower = core::to_lower(input);
    static constexpr std::array<std::string_view, 8> kPatterns{
        "<script", "javascript:", "onerror=", "onload=",
        "<iframe", "<object",     "<embed",   "vbscript:",
    };
    for (auto pattern : kPatterns) {
        if (lower.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Validators
// ============================================================================

Status StringValidator::validate(const nlohmann::json& value) const {
    if (!value.is_string()) {
        return invalid(fmt::format("expected string, got {}", json_type_name(value)));
    }
    return validate_string(value.get_ref<const std::string&>());
}

Status StringValidator::validate_string(std::string_view str) const {
    if (min_length > 0 && str.size() < min_length) {
        return invalid(fmt::format("string too short: minimum {} characters", min_length));
    }

    if (max_length > 0 && str.size() > max_length) {
        return invalid(fmt::format("string exceeds max length {}", max_length));
    }

    if (disallow_null_bytes && str.find('\0') != std::string_view::npos) {
        return invalid("string contains null bytes");
    }

    if (disallow_control_chars) {
        for (unsigned char c : str) {
            if (c < 32 && c != '\n' && c != '\t' && c != '\r') {
                return invalid("string contains control characters");
            }
        }
    }

    if (check_sql_injection && contains_sql_injection(str)) {
        return invalid("potential SQL injection detected");
    }

    if (check_command_injection && contains_command_injection(str)) {
        return invalid("potential command injection detected");
    }

    if (check_xss && contains_xss(str)) {
        return invalid("potential script injection detected");
    }

    if (pattern && !pattern->matches(str)) {
        return invalid("string does not match required pattern");
    }

    if (!allowed_values.empty()) {
        for (const auto& allowed : allowed_values) {
            if (str == allowed) {
                return Status::success();
            }
        }
        return invalid("string not in allowlist");
    }

    return Status::success();
}

Status IntValidator::validate(const nlohmann::json& value) const {
    int64_t v = 0;
    if (value.is_number_integer()) {
        v = value.get<int64_t>();
    } else if (value.is_number_float()) {
        v = static_cast<int64_t>(value.get<double>());
    } else {
        return invalid(fmt::format("expected integer, got {}", json_type_name(value)));
    }

    if (min && v < *min) {
        return invalid(fmt::format("integer {} is less than minimum {}", v, *min));
    }
    if (max && v > *max) {
        return invalid(fmt::format("integer {} exceeds maximum {}", v, *max));
    }
    return Status::success();
}

Status FloatValidator::validate(const nlohmann::json& value) const {
    if (!value.is_number()) {
        return invalid(fmt::format("expected number, got {}", json_type_name(value)));
    }
    double v = value.get<double>();

    if (min && v < *min) {
        return invalid(fmt::format("number {:f} is less than minimum {:f}", v, *min));
    }
    if (max && v > *max) {
        return invalid(fmt::format("number {:f} exceeds maximum {:f}", v, *max));
    }
    return Status::success();
}

// ============================================================================
// Paths and names
// ============================================================================

PathResult sanitize_file_path(std::string_view path, std::string_view base_dir) {
    namespace fs = std::filesystem;

    if (path.find('\0') != std::string_view::npos) {
        return PathResult::failure("path contains null bytes");
    }

    fs::path cleaned = fs::path(std::string(path)).lexically_normal();
    for (const auto& part : cleaned) {
        if (part == "..") {
            return PathResult::failure("path traversal detected");
        }
    }

    if (base_dir.empty()) {
        return PathResult::success(cleaned.string());
    }

    std::error_code ec;
    fs::path abs_base = fs::absolute(fs::path(std::string(base_dir)), ec).lexically_normal();
    if (ec) {
        return PathResult::failure("invalid base directory: " + ec.message());
    }
    // "dir/" normalizes to "dir/" with an empty filename; drop it
    if (!abs_base.has_filename() && abs_base.has_parent_path() && abs_base != abs_base.root_path()) {
        abs_base = abs_base.parent_path();
    }

    fs::path abs_path = cleaned.is_absolute() ? cleaned : (abs_base / cleaned).lexically_normal();

    auto rel = abs_path.lexically_relative(abs_base);
    if (rel.empty() || *rel.begin() == "..") {
        return PathResult::failure("path is outside allowed directory");
    }

    return PathResult::success(abs_path.string());
}

Status validate_file_path(std::string_view path) {
    if (path.empty()) {
        return invalid("file path cannot be empty");
    }
    auto result = sanitize_file_path(path);
    if (!result) {
        return invalid("invalid file path: " + result.error);
    }
    return Status::success();
}

std::string sanitize_string(std::string_view input) {
    std::string cleaned;
    cleaned.reserve(input.size());
    for (unsigned char c : input) {
        if (c >= 32 || c == '\n' || c == '\t' || c == '\r') {
            cleaned.push_back(static_cast<char>(c));
        }
    }
    return cleaned;
}

Status validate_tool_name(std::string_view name) {
    if (name.empty()) {
        return invalid("tool name cannot be empty");
    }

    if (name.size() > kMaxToolNameLength) {
        return invalid("tool name too long");
    }

    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == ':' || c == '-';
        if (!ok) {
            return invalid(
                "invalid tool name: must contain only alphanumeric, underscore, hyphen, and colon");
        }
    }

    return Status::success();
}

Status validate_json_object(const nlohmann::json& value, size_t max_keys) {
    if (value.is_null()) {
        return invalid("value cannot be null");
    }
    if (!value.is_object()) {
        return invalid(fmt::format("expected JSON object, got {}", json_type_name(value)));
    }
    if (value.size() > max_keys) {
        return invalid(fmt::format("JSON object has {} keys, maximum is {}", value.size(), max_keys));
    }
    for (const auto& item : value.items()) {
        if (item.key().size() > kMaxJsonKeyLength) {
            return invalid(fmt::format("JSON key length {} exceeds maximum {}", item.key().size(),
                                       kMaxJsonKeyLength));
        }
    }
    return Status::success();
}

}  // namespace warden::security
