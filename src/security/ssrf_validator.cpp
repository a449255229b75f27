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


// Warden SSRF Validator - Implementation

#include "ssrf_validator.hpp"

#include <httplib.h>

#include <cstdlib>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../http/url.hpp"

namespace warden::security {

using core::ErrorKind;
using core::IpAddress;
using core::Status;

namespace {

Status blocked(std::string error) {
    return Status::failure(ErrorKind::SsrfBlocked, std::move(error));
}

// Service names that may be absent from DNS outside their container network
bool is_service_hostname(std::string_view host) {
    return host == "ollama" || host == "ollama-service" || core::ends_with(host, ".local");
}

// Address classes (IPv4 in bytes[0..3], IPv6 in bytes[0..15])

bool is_loopback(const IpAddress& ip) {
    if (!ip.v6) {
        return ip.bytes[0] == 127;
    }
    for (int i = 0; i < 15; ++i) {
        if (ip.bytes[i] != 0) {
            return false;
        }
    }
    return ip.bytes[15] == 1;
}

bool is_unspecified(const IpAddress& ip) {
    int n = ip.v6 ? 16 : 4;
    for (int i = 0; i < n; ++i) {
        if (ip.bytes[i] != 0) {
            return false;
        }
    }
    return true;
}

bool is_private(const IpAddress& ip) {
    const auto& b = ip.bytes;
    if (!ip.v6) {
        return b[0] == 10 || (b[0] == 172 && (b[1] & 0xF0) == 16) || (b[0] == 192 && b[1] == 168);
    }
    return (b[0] & 0xFE) == 0xFC;  // fc00::/7
}

bool is_link_local_unicast(const IpAddress& ip) {
    const auto& b = ip.bytes;
    if (!ip.v6) {
        return b[0] == 169 && b[1] == 254;
    }
    return b[0] == 0xFE && (b[1] & 0xC0) == 0x80;  // fe80::/10
}

bool is_multicast(const IpAddress& ip) {
    if (!ip.v6) {
        return (ip.bytes[0] & 0xF0) == 0xE0;  // 224.0.0.0/4
    }
    return ip.bytes[0] == 0xFF;
}

bool is_link_local_multicast(const IpAddress& ip) {
    const auto& b = ip.bytes;
    if (!ip.v6) {
        return b[0] == 224 && b[1] == 0 && b[2] == 0;  // 224.0.0.0/24
    }
    return b[0] == 0xFF && (b[1] & 0x0F) == 0x02;  // ff02::/16
}

// 0.0.0.0/8 and 240.0.0.0/4 (includes broadcast)
bool is_reserved(const IpAddress& ip) {
    if (ip.v6) {
        return false;
    }
    return ip.bytes[0] == 0 || (ip.bytes[0] & 0xF0) == 0xF0;
}

bool is_metadata(const IpAddress& ip) {
    return !ip.v6 && ip.bytes[0] == 169 && ip.bytes[1] == 254 && ip.bytes[2] == 169 &&
           ip.bytes[3] == 254;
}

}  // namespace

SsrfValidator::SsrfValidator(SsrfConfig config) : config_(std::move(config)) {
    if (config_.allowed_schemes.empty()) {
        config_.allowed_schemes = {"http", "https"};
    }
    for (const auto& host : config_.allowed_hosts) {
        allowed_hosts_.insert(core::to_lower(host));
    }
}

// ============================================================================
// Validation
// ============================================================================

Status SsrfValidator::validate_url(std::string_view raw_url) const {
    auto parsed = http::url::parse(raw_url);
    if (!parsed) {
        return blocked("invalid URL: malformed or relative URL");
    }

    bool scheme_allowed = false;
    for (const auto& scheme : config_.allowed_schemes) {
        if (core::iequals(parsed->scheme, scheme)) {
            scheme_allowed = true;
            break;
        }
    }
    if (!scheme_allowed) {
        return blocked(fmt::format("invalid URL scheme: {} (only {} allowed)", parsed->scheme,
                                   core::join(config_.allowed_schemes, ", ")));
    }

    if (parsed->host.empty()) {
        return blocked("invalid URL: hostname is required");
    }

    return validate_host(parsed->host);
}

Status SsrfValidator::validate_host(std::string_view host) const {
    std::vector<IpAddress> addresses;
    return resolve_and_validate(host, addresses);
}

Status SsrfValidator::resolve_and_validate(std::string_view host,
                                           std::vector<IpAddress>& addresses) const {
    addresses.clear();
    std::string host_lower = core::to_lower(host);

    if (host_lower.empty()) {
        return blocked("invalid host: empty hostname");
    }

    if (!allowed_hosts_.empty() && !allowed_hosts_.contains(host_lower)) {
        return blocked(fmt::format("host not in allowlist: {}", host));
    }

    if (config_.allow_localhost && host_lower == "localhost") {
        addresses.push_back(*IpAddress::parse("127.0.0.1"));
        return Status::success();
    }

    std::string error;
    auto resolved = core::resolve_host(host_lower, error);
    if (!resolved) {
        if (is_service_hostname(host_lower)) {
            WARDEN_LOG_DEBUG("SSRF: tolerating unresolved service host {}", host_lower);
            return Status::success();
        }
        return blocked("invalid IP address: " + error);
    }

    for (const auto& ip : *resolved) {
        auto status = validate_ip(ip);
        if (!status) {
            return blocked("invalid IP address: " + status.error);
        }
    }

    addresses = std::move(*resolved);
    return Status::success();
}

Status SsrfValidator::validate_ip(const IpAddress& ip) const {
    std::string text = ip.to_string();

    if (is_loopback(ip)) {
        if (config_.allow_localhost) {
            return Status::success();
        }
        return blocked(fmt::format("loopback addresses not allowed: {}", text));
    }

    if (is_unspecified(ip) || is_reserved(ip)) {
        return blocked(fmt::format("reserved addresses not allowed: {}", text));
    }

    if (config_.block_metadata && is_metadata(ip)) {
        return blocked(fmt::format("metadata service address blocked: {}", text));
    }

    if (config_.block_private_ips && is_private(ip)) {
        return blocked(fmt::format("private IP addresses not allowed: {}", text));
    }

    if (config_.block_link_local && (is_link_local_unicast(ip) || is_link_local_multicast(ip))) {
        return blocked(fmt::format("link-local addresses not allowed: {}", text));
    }

    if (is_multicast(ip)) {
        return blocked(fmt::format("multicast addresses not allowed: {}", text));
    }

    return Status::success();
}

Status SsrfValidator::validate_ip(std::string_view ip) const {
    auto parsed = IpAddress::parse(ip);
    if (!parsed) {
        return blocked(fmt::format("invalid IP address: {}", ip));
    }
    return validate_ip(*parsed);
}

// ============================================================================
// Dial-time re-validation
// ============================================================================

SecureConnection SsrfValidator::secure_connect(std::string_view host, uint16_t port,
                                               std::chrono::milliseconds timeout) const {
    SecureConnection conn;

    std::vector<IpAddress> addresses;
    auto status = resolve_and_validate(host, addresses);
    if (!status) {
        conn.status = blocked("connection blocked: " + status.error);
        return conn;
    }
    if (addresses.empty()) {
        conn.status = blocked(fmt::format("connection blocked: cannot resolve {}", host));
        return conn;
    }

    std::error_code last_error;
    for (const auto& address : addresses) {
        auto fd = core::connect_to(address, port, timeout, last_error);
        if (fd.valid()) {
            conn.fd = std::move(fd);
            conn.address = address;
            return conn;
        }
        WARDEN_LOG_DEBUG("SSRF: connect to {}:{} failed: {}", address.to_string(), port,
                         last_error.message());
    }

    ErrorKind kind = last_error == std::errc::timed_out ? ErrorKind::Timeout : ErrorKind::Internal;
    conn.status = Status::failure(
        kind, fmt::format("dial {}:{}: {}", host, port, last_error.message()));
    return conn;
}

std::unique_ptr<httplib::Client> SsrfValidator::create_secure_client(std::string_view url,
                                                                     Status& status) const {
    status = validate_url(url);
    if (!status) {
        return nullptr;
    }

    auto parsed = http::url::parse(url);
    std::vector<IpAddress> addresses;
    status = resolve_and_validate(parsed->host, addresses);
    if (!status) {
        return nullptr;
    }

    auto client = std::make_unique<httplib::Client>(parsed->origin());
    if (!addresses.empty() && !IpAddress::parse(parsed->host)) {
        // TLS SNI and Host still use the name; only the connect target is pinned
        client->set_hostname_addr_map({{parsed->host, addresses.front().to_string()}});
    }
    client->set_connection_timeout(std::chrono::seconds(10));
    return client;
}

// ============================================================================
// Ollama defaults
// ============================================================================

std::vector<std::string> ollama_allowed_hosts() {
    std::vector<std::string> hosts = {"localhost", "127.0.0.1", "::1", "ollama", "ollama-service"};

    if (const char* env = std::getenv("OLLAMA_ALLOWED_HOSTS"); env && *env) {
        for (const auto& entry : core::split(env, ',')) {
            auto host = core::trim(entry);
            if (!host.empty()) {
                hosts.emplace_back(host);
            }
        }
    }

    return hosts;
}

SsrfValidator make_ollama_validator() {
    SsrfConfig config;
    config.allowed_hosts = ollama_allowed_hosts();
    return SsrfValidator(std::move(config));
}

}  // namespace warden::security
