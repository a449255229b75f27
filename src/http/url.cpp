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


// Warden URL - Implementation

#include "url.hpp"

#include <charconv>

#include "../core/string_utils.hpp"

namespace warden::http {

std::string ParsedUrl::origin() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return scheme + "://" + h + ":" + std::to_string(port);
}

namespace url {

std::optional<ParsedUrl> parse(std::string_view raw) {
    for (unsigned char c : raw) {
        if (c <= 0x20 || c == 0x7F) {
            return std::nullopt;  // Whitespace and control characters
        }
    }

    size_t scheme_end = raw.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = core::to_lower(raw.substr(0, scheme_end));
    for (char c : parsed.scheme) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '-' ||
                  c == '.';
        if (!ok) {
            return std::nullopt;
        }
    }

    std::string_view rest = raw.substr(scheme_end + 3);
    size_t authority_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, authority_end);
    std::string_view tail =
        authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    // Drop userinfo
    size_t at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view host;
    std::string_view port_str;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        host = authority.substr(1, close - 1);
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::nullopt;
            }
            port_str = after.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port_str = authority.substr(colon + 1);
        } else {
            host = authority;
        }
    }

    parsed.host = core::to_lower(host);

    if (!port_str.empty()) {
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port == 0 ||
            port > 65535) {
            return std::nullopt;
        }
        parsed.port = static_cast<uint16_t>(port);
    } else if (parsed.scheme == "http") {
        parsed.port = 80;
    } else if (parsed.scheme == "https") {
        parsed.port = 443;
    }

    // Fragment never goes on the wire
    size_t fragment = tail.find('#');
    if (fragment != std::string_view::npos) {
        tail = tail.substr(0, fragment);
    }
    if (tail.empty()) {
        parsed.path = "/";
    } else if (tail.front() == '?') {
        parsed.path = "/" + std::string(tail);
    } else {
        parsed.path = std::string(tail);
    }

    return parsed;
}

std::string join_path(std::string_view base, std::string_view path) {
    std::string result(base);
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    if (path.empty() || path.front() != '/') {
        result.push_back('/');
    }
    result.append(path);
    return result;
}

}  // namespace url

}  // namespace warden::http
