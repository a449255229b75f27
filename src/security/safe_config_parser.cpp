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


// Warden Safe Config Parser - Implementation

#include "safe_config_parser.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fmt/format.h>

namespace warden::security {

using core::ErrorKind;
using core::Status;

namespace {

Status too_large(std::string error) {
    return Status::failure(ErrorKind::Validation, std::move(error));
}

// Plain scalars get YAML 1.2 core-schema typing; quoted scalars stay strings
nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        return text;
    }

    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return nullptr;
    }

    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        return b;
    }

    int64_t i = 0;
    if (YAML::convert<int64_t>::decode(node, i)) {
        return i;
    }

    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) {
        return d;
    }

    return text;
}

nlohmann::json to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(to_json(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] = to_json(entry.second);
            }
            return object;
        }
    }
    return nullptr;
}

}  // namespace

Status SafeConfigParser::check_node(const YAML::Node& node, size_t depth,
                                    size_t& node_count) const {
    if (depth > limits_.max_depth) {
        return too_large(
            fmt::format("YAML nesting depth {} exceeds maximum {}", depth, limits_.max_depth));
    }

    if (++node_count > limits_.max_nodes) {
        return too_large(fmt::format("YAML node count exceeds maximum {}", limits_.max_nodes));
    }

    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& entry : node) {
                const YAML::Node& key = entry.first;
                if (key.IsScalar() && key.Scalar().size() > limits_.max_key_length) {
                    return too_large(fmt::format("YAML key length {} exceeds maximum {}",
                                                 key.Scalar().size(), limits_.max_key_length));
                }
                if (!key.IsScalar()) {
                    return Status::failure(ErrorKind::Validation,
                                           "YAML parse error: mapping keys must be scalars");
                }
                if (auto status = check_node(key, depth + 1, node_count); !status) {
                    return status;
                }
                if (auto status = check_node(entry.second, depth + 1, node_count); !status) {
                    return status;
                }
            }
            break;

        case YAML::NodeType::Sequence:
            for (const auto& item : node) {
                if (auto status = check_node(item, depth + 1, node_count); !status) {
                    return status;
                }
            }
            break;

        case YAML::NodeType::Scalar:
            if (node.Scalar().size() > limits_.max_value_size) {
                return too_large(fmt::format("YAML value size {} exceeds maximum {}",
                                             node.Scalar().size(), limits_.max_value_size));
            }
            break;

        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }

    return Status::success();
}

ParseResult SafeConfigParser::parse(std::string_view text) const {
    if (text.size() > limits_.max_input_size) {
        return ParseResult::failure(fmt::format("YAML input size {} exceeds maximum {}",
                                                text.size(), limits_.max_input_size));
    }

    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return ParseResult::failure(fmt::format("YAML parse error: {}", e.what()));
    }

    size_t node_count = 0;
    if (auto status = check_node(root, 0, node_count); !status) {
        return ParseResult::failure(std::move(status.error));
    }

    try {
        return ParseResult::success(to_json(root));
    } catch (const YAML::Exception& e) {
        return ParseResult::failure(fmt::format("YAML parse error: {}", e.what()));
    }
}

ParseResult SafeConfigParser::parse_file(const std::string& path) const {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return ParseResult::failure(fmt::format("cannot read config file {}: {}", path,
                                                ec.message()));
    }
    if (size > limits_.max_input_size) {
        return ParseResult::failure(
            fmt::format("YAML input size {} exceeds maximum {}", size, limits_.max_input_size));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return ParseResult::failure(fmt::format("cannot open config file: {}", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

Status SafeConfigParser::validate_file(const std::string& path) const {
    auto result = parse_file(path);
    if (!result) {
        return Status::failure(ErrorKind::Validation, std::move(result.error));
    }
    return Status::success();
}

}  // namespace warden::security
