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


// Warden API Key Store - Header
// Loads API key to principal bindings from the environment or a key file

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../core/status.hpp"
#include "principal.hpp"

namespace warden::auth {

inline constexpr std::string_view kDefaultApiKeyEnvPrefix = "AIXGO_API_KEY_";

struct ApiKeyEntry {
    std::string key;
    Principal principal;
};

/// Collect <prefix><user>=<key> environment variables. Each principal gets
/// roles {user}, permissions {read, execute} and metadata source=environment.
[[nodiscard]] std::vector<ApiKeyEntry> load_api_keys_from_environment(std::string_view prefix);

/// Read a key file: a JSON object {"user":"key"} or user=key lines with #
/// comments. Fails when the file is world-readable or holds no valid keys.
[[nodiscard]] core::Status load_api_keys_from_file(const std::string& path,
                                                   std::vector<ApiKeyEntry>& entries);

}  // namespace warden::auth
