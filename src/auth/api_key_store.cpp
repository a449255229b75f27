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


// Warden API Key Store - Implementation

#include "api_key_store.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

extern char** environ;

namespace warden::auth {

using core::ErrorKind;
using core::Status;

namespace {

Principal make_key_principal(const std::string& user_id, std::string source) {
    Principal principal;
    principal.id = user_id;
    principal.name = user_id;
    principal.roles = {"user"};
    principal.permissions = {Permission::Read, Permission::Execute};
    principal.metadata["source"] = std::move(source);
    return principal;
}

// JSON object form; false when the content is not a JSON object
bool parse_json_keys(const std::string& content, std::vector<ApiKeyEntry>& entries) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error&) {
        return false;
    }
    if (!j.is_object()) {
        return false;
    }

    for (const auto& item : j.items()) {
        if (!item.value().is_string()) {
            continue;
        }
        const std::string& user_id = item.key();
        std::string key = item.value().get<std::string>();
        if (user_id.empty() || key.empty()) {
            continue;
        }
        entries.push_back({std::move(key), make_key_principal(user_id, "file")});
    }
    return true;
}

void parse_line_keys(const std::string& content, std::vector<ApiKeyEntry>& entries) {
    std::istringstream stream(content);
    std::string raw;
    size_t line_number = 0;

    while (std::getline(stream, raw)) {
        ++line_number;
        std::string_view line = core::trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            WARDEN_LOG_WARNING("API key file: invalid format at line {}, expected user_id=api_key",
                               line_number);
            continue;
        }

        std::string user_id(core::trim(line.substr(0, eq)));
        std::string key(core::trim(line.substr(eq + 1)));
        if (user_id.empty() || key.empty()) {
            WARDEN_LOG_WARNING("API key file: empty user_id or api_key at line {}", line_number);
            continue;
        }

        Principal principal = make_key_principal(user_id, "file");
        principal.metadata["line"] = std::to_string(line_number);
        entries.push_back({std::move(key), std::move(principal)});
    }
}

}  // namespace

std::vector<ApiKeyEntry> load_api_keys_from_environment(std::string_view prefix) {
    if (prefix.empty()) {
        prefix = kDefaultApiKeyEnvPrefix;
    }

    std::vector<ApiKeyEntry> entries;
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        std::string_view var(*env);
        if (var.substr(0, prefix.size()) != prefix) {
            continue;
        }

        size_t eq = var.find('=');
        if (eq == std::string_view::npos || eq < prefix.size()) {
            continue;
        }

        std::string user_id(var.substr(prefix.size(), eq - prefix.size()));
        std::string key(var.substr(eq + 1));
        if (user_id.empty() || key.empty()) {
            continue;
        }
        entries.push_back({std::move(key), make_key_principal(user_id, "environment")});
    }
    return entries;
}

Status load_api_keys_from_file(const std::string& path, std::vector<ApiKeyEntry>& entries) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return Status::failure(ErrorKind::Validation,
                               std::string("failed to stat file: ") + std::strerror(errno));
    }

    if ((st.st_mode & S_IROTH) != 0) {
        char mode[8];
        std::snprintf(mode, sizeof(mode), "%o", static_cast<unsigned>(st.st_mode & 0777));
        return Status::failure(ErrorKind::Validation,
                               std::string("insecure file permissions: file is world-readable (mode: ") +
                                   mode + ")");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Status::failure(ErrorKind::Validation, "failed to open file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    std::vector<ApiKeyEntry> loaded;
    if (!parse_json_keys(content, loaded)) {
        parse_line_keys(content, loaded);
    }

    if (loaded.empty()) {
        return Status::failure(ErrorKind::Validation, "no valid API keys found in file");
    }

    for (auto& entry : loaded) {
        entries.push_back(std::move(entry));
    }
    return Status::success();
}

}  // namespace warden::auth
