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


// Warden SSRF Validator - Header
// Outbound URL/host/IP validation with dial-time re-validation

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../core/socket.hpp"
#include "../core/status.hpp"

namespace httplib {
class Client;
}

namespace warden::security {

/// SSRF protection settings
struct SsrfConfig {
    std::vector<std::string> allowed_hosts;  // Empty = any host (subject to IP checks)
    std::vector<std::string> allowed_schemes = {"http", "https"};
    bool allow_localhost = true;
    bool block_private_ips = true;  // RFC1918 / RFC4193
    bool block_metadata = true;     // 169.254.169.254
    bool block_link_local = true;
};

/// Connected socket plus the address it was pinned to
struct SecureConnection {
    core::Status status;
    core::UniqueFd fd;
    core::IpAddress address;

    [[nodiscard]] explicit operator bool() const noexcept { return status.ok; }
};

/// Validates outbound targets against server-side request forgery.
/// Immutable after construction; safe to share between threads.
class SsrfValidator {
public:
    explicit SsrfValidator(SsrfConfig config = {});

    /// Scheme allow-list, then validate_host() on the URL's host
    [[nodiscard]] core::Status validate_url(std::string_view raw_url) const;

    /// Host allow-list, then validate_ip() on every resolved address
    [[nodiscard]] core::Status validate_host(std::string_view host) const;

    [[nodiscard]] core::Status validate_ip(const core::IpAddress& ip) const;

    /// Parse and validate a literal address
    [[nodiscard]] core::Status validate_ip(std::string_view ip) const;

    /// Resolve, validate each address again and connect to a validated
    /// address directly (no second DNS lookup between check and connect)
    [[nodiscard]] SecureConnection secure_connect(
        std::string_view host, uint16_t port,
        std::chrono::milliseconds timeout = std::chrono::seconds(10)) const;

    /// httplib client for `url` with the host pinned to an address validated
    /// now. Returns nullptr and fills `status` when the target is rejected.
    [[nodiscard]] std::unique_ptr<httplib::Client> create_secure_client(std::string_view url,
                                                                        core::Status& status) const;

    [[nodiscard]] const SsrfConfig& config() const noexcept { return config_; }

private:
    // Resolve `host` and validate every address. `addresses` is left empty
    // when a tolerated service name fails to resolve.
    [[nodiscard]] core::Status resolve_and_validate(std::string_view host,
                                                    std::vector<core::IpAddress>& addresses) const;

    SsrfConfig config_;
    core::fast_set<std::string> allowed_hosts_;  // Lower-cased
};

/// Default Ollama hosts plus comma-separated OLLAMA_ALLOWED_HOSTS entries
[[nodiscard]] std::vector<std::string> ollama_allowed_hosts();

/// Validator restricted to ollama_allowed_hosts()
[[nodiscard]] SsrfValidator make_ollama_validator();

}  // namespace warden::security
