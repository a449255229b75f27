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


// Warden Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace warden::core {

namespace {

bool is_v4_mapped(const uint8_t* b) {
    for (int i = 0; i < 10; ++i) {
        if (b[i] != 0) {
            return false;
        }
    }
    return b[10] == 0xFF && b[11] == 0xFF;
}

IpAddress from_v6_bytes(const uint8_t* b) {
    IpAddress ip;
    if (is_v4_mapped(b)) {
        std::memcpy(ip.bytes.data(), b + 12, 4);
        return ip;
    }
    ip.v6 = true;
    std::memcpy(ip.bytes.data(), b, 16);
    return ip;
}

}  // namespace

std::optional<IpAddress> IpAddress::parse(std::string_view text) {
    std::string str{text};

    in_addr v4{};
    if (inet_pton(AF_INET, str.c_str(), &v4) == 1) {
        IpAddress ip;
        std::memcpy(ip.bytes.data(), &v4, 4);
        return ip;
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, str.c_str(), &v6) == 1) {
        return from_v6_bytes(reinterpret_cast<const uint8_t*>(&v6));
    }

    return std::nullopt;
}

std::string IpAddress::to_string() const {
    char buffer[INET6_ADDRSTRLEN] = {};
    if (!inet_ntop(v6 ? AF_INET6 : AF_INET, bytes.data(), buffer, sizeof(buffer))) {
        return {};
    }
    return buffer;
}

std::optional<std::vector<IpAddress>> resolve_host(std::string_view host, std::string& error) {
    if (auto literal = IpAddress::parse(host)) {
        return std::vector<IpAddress>{*literal};
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string host_str{host};
    int rc = getaddrinfo(host_str.c_str(), nullptr, &hints, &result);
    if (rc != 0 || !result) {
        error = "lookup " + host_str + ": " + gai_strerror(rc);
        return std::nullopt;
    }

    std::vector<IpAddress> addresses;
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        IpAddress ip;
        if (ai->ai_family == AF_INET) {
            auto* sin = reinterpret_cast<sockaddr_in*>(ai->ai_addr);
            std::memcpy(ip.bytes.data(), &sin->sin_addr, 4);
        } else if (ai->ai_family == AF_INET6) {
            auto* sin6 = reinterpret_cast<sockaddr_in6*>(ai->ai_addr);
            ip = from_v6_bytes(reinterpret_cast<const uint8_t*>(&sin6->sin6_addr));
        } else {
            continue;
        }
        if (std::find(addresses.begin(), addresses.end(), ip) == addresses.end()) {
            addresses.push_back(ip);
        }
    }
    freeaddrinfo(result);

    if (addresses.empty()) {
        error = "lookup " + host_str + ": no addresses";
        return std::nullopt;
    }
    return addresses;
}

void UniqueFd::reset(int fd) {
    if (fd_ >= 0 && fd_ != fd) {
        close_fd(fd_);
    }
    fd_ = fd;
}

UniqueFd connect_to(const IpAddress& address, uint16_t port, std::chrono::milliseconds timeout,
                    std::error_code& ec) {
    ec.clear();

    sockaddr_storage storage{};
    socklen_t len = 0;
    if (address.v6) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&storage);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        std::memcpy(&sin6->sin6_addr, address.bytes.data(), 16);
        len = sizeof(sockaddr_in6);
    } else {
        auto* sin = reinterpret_cast<sockaddr_in*>(&storage);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        std::memcpy(&sin->sin_addr, address.bytes.data(), 4);
        len = sizeof(sockaddr_in);
    }

    UniqueFd fd(socket(address.v6 ? AF_INET6 : AF_INET, SOCK_STREAM, 0));
    if (!fd.valid()) {
        ec = std::error_code(errno, std::system_category());
        return {};
    }

    int flags = fcntl(fd.get(), F_GETFL, 0);
    if (flags < 0 || fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        ec = std::error_code(errno, std::system_category());
        return {};
    }

    if (connect(fd.get(), reinterpret_cast<sockaddr*>(&storage), len) < 0) {
        if (errno != EINPROGRESS) {
            ec = std::error_code(errno, std::system_category());
            return {};
        }

        pollfd pfd{fd.get(), POLLOUT, 0};
        int rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc == 0) {
            ec = std::make_error_code(std::errc::timed_out);
            return {};
        }
        if (rc < 0) {
            ec = std::error_code(errno, std::system_category());
            return {};
        }

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
            ec = std::error_code(errno, std::system_category());
            return {};
        }
        if (so_error != 0) {
            ec = std::error_code(so_error, std::system_category());
            return {};
        }
    }

    // Restore blocking mode for the caller
    if (fcntl(fd.get(), F_SETFL, flags) < 0) {
        ec = std::error_code(errno, std::system_category());
        return {};
    }

    return fd;
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return std::error_code(errno, std::system_category());
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::error_code(errno, std::system_category());
    }

    return {};
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

}  // namespace warden::core
