#pragma once

#include <netinet/in.h>

#include <cstdint>
#include <optional>
#include <string>

namespace net {

// Owned socket descriptor, closed exactly once
struct Socket {
    int fd = -1;

    bool is_open() const { return fd >= 0; }
    void close();

    // Move-only
    Socket() = default;
    explicit Socket(int fd) : fd(fd) {}
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
};

// Non-blocking IPv4 UDP socket, invalid on failure
Socket udp_socket();

// Non-blocking IPv4 TCP socket, invalid on failure
Socket tcp_socket();

bool set_nonblocking(int fd);

// Dotted-quad IPv4 address, no name resolution
std::optional<in_addr> parse_ipv4(const std::string& host);

sockaddr_in make_address(in_addr addr, uint16_t port);

// "a.b.c.d:port"
std::string to_string(const sockaddr_in& addr);

// strerror(errno) of the calling context
std::string last_error();

} // namespace net
