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


// Warden URL - Header
// Minimal absolute-URL parser for outbound target validation

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace warden::http {

/// Components of an absolute URL (scheme://[user@]host[:port][/path][?query])
struct ParsedUrl {
    std::string scheme;  // Lower-cased
    std::string host;    // Lower-cased; IPv6 literals without brackets
    uint16_t port = 0;   // Explicit port, or scheme default (80/443), 0 if unknown
    std::string path;    // Path plus query; "/" when absent

    /// "scheme://host:port" suitable for httplib::Client
    [[nodiscard]] std::string origin() const;
};

namespace url {

/// Parse an absolute URL. Returns nullopt for relative URLs, control
/// characters, malformed authorities or out-of-range ports.
[[nodiscard]] std::optional<ParsedUrl> parse(std::string_view raw);

/// Join a base URL (no trailing slash required) and a path
[[nodiscard]] std::string join_path(std::string_view base, std::string_view path);

}  // namespace url

}  // namespace warden::http
