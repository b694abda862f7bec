#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace net {

Socket::Socket(Socket&& other) noexcept : fd(other.fd) {
    other.fd = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd = other.fd;
        other.fd = -1;
    }
    return *this;
}

Socket::~Socket() {
    close();
}

void Socket::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

static Socket make_socket(int type) {
    int fd = ::socket(AF_INET, type | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return {};
    }

    Socket sock(fd);
    if (!set_nonblocking(fd)) {
        return {};
    }
    return sock;
}

Socket udp_socket() {
    return make_socket(SOCK_DGRAM);
}

Socket tcp_socket() {
    return make_socket(SOCK_STREAM);
}

std::optional<in_addr> parse_ipv4(const std::string& host) {
    in_addr addr{};
    if (inet_pton(AF_INET, host.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return addr;
}

sockaddr_in make_address(in_addr addr, uint16_t port) {
    sockaddr_in result = {};
    result.sin_family = AF_INET;
    result.sin_addr = addr;
    result.sin_port = htons(port);
    return result;
}

std::string to_string(const sockaddr_in& addr) {
    char buf[INET_ADDRSTRLEN] = {};
    if (!inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf))) {
        return "?";
    }
    return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
}

std::string last_error() {
    return strerror(errno);
}

} // namespace net
