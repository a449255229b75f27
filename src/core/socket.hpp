// Warden Socket Utilities - Header
// Address parsing, DNS resolution and timed outbound connects

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace warden::core {

/// IPv4 or IPv6 address in network byte order.
/// IPv4-mapped IPv6 addresses (::ffff:a.b.c.d) are stored as IPv4.
struct IpAddress {
    bool v6 = false;
    std::array<uint8_t, 16> bytes{};  // IPv4 uses the first 4 bytes

    /// Parse a literal ("10.0.0.1", "::1"); brackets are not accepted
    [[nodiscard]] static std::optional<IpAddress> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const IpAddress& other) const noexcept {
        return v6 == other.v6 && bytes == other.bytes;
    }
};

/// Resolve a hostname (or literal) to all of its addresses.
/// Returns nullopt and fills `error` when resolution fails.
[[nodiscard]] std::optional<std::vector<IpAddress>> resolve_host(std::string_view host,
                                                                 std::string& error);

/// Owning file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1);

private:
    int fd_ = -1;
};

/// Connect a TCP socket to exactly `address:port`, waiting at most `timeout`.
/// The returned socket is blocking.
[[nodiscard]] UniqueFd connect_to(const IpAddress& address, uint16_t port,
                                  std::chrono::milliseconds timeout, std::error_code& ec);

[[nodiscard]] std::error_code set_nonblocking(int fd);

void close_fd(int fd);

}  // namespace warden::core
