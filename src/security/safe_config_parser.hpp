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


// Warden Safe Config Parser - Header
// Resource-bounded YAML/JSON decoding (depth, node count, key and value size)

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../core/status.hpp"

namespace YAML {
class Node;
}

namespace warden::security {

/// Limits enforced before any typed decode
struct SafeParseLimits {
    size_t max_input_size = 10 * 1024 * 1024;  // 10 MiB
    size_t max_depth = 20;
    size_t max_nodes = 10000;
    size_t max_key_length = 1024;
    size_t max_value_size = 1024 * 1024;  // 1 MiB
};

/// Parse outcome; `json` is only meaningful when valid
struct ParseResult {
    bool valid = false;
    nlohmann::json json;
    std::string error;

    [[nodiscard]] static ParseResult success(nlohmann::json json) {
        return {true, std::move(json), ""};
    }

    [[nodiscard]] static ParseResult failure(std::string error) {
        return {false, nullptr, std::move(error)};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// YAML (and therefore JSON) parser that rejects inputs exceeding the limits.
/// Aliases are counted every time they are reached, so alias bombs hit
/// max_nodes instead of expanding.
class SafeConfigParser {
public:
    explicit SafeConfigParser(SafeParseLimits limits = {}) : limits_(limits) {}

    [[nodiscard]] ParseResult parse(std::string_view text) const;

    /// Rejects files over max_input_size before reading them
    [[nodiscard]] ParseResult parse_file(const std::string& path) const;

    [[nodiscard]] core::Status validate_file(const std::string& path) const;

    [[nodiscard]] const SafeParseLimits& limits() const noexcept { return limits_; }

private:
    [[nodiscard]] core::Status check_node(const YAML::Node& node, size_t depth,
                                          size_t& node_count) const;

    SafeParseLimits limits_;
};

}  // namespace warden::security
