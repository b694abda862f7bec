#include "ssdp.hpp"
#include "socket.hpp"

#include <protocol/parse.hpp>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <iostream>
#include <memory>

namespace ssdp {

namespace {

constexpr size_t MAX_DATAGRAM = 8192;

// State of one discovery cycle, kept alive by the loop callbacks that reference it
struct Session : std::enable_shared_from_this<Session> {
    event_loop::Loop& loop;
    Options options;
    Completion on_complete;

    net::Socket socket;
    event_loop::WatchId watch_id = 0;
    event_loop::TimerId timer_id = 0;
    bool finished = false;

    Result result;

    Session(event_loop::Loop& loop, Options options, Completion on_complete)
        : loop(loop), options(std::move(options)), on_complete(std::move(on_complete)) {}

    bool setup();
    bool send_probe();
    void on_readable(short revents);
    void finish(yeelight::DiscoveryStatus status, std::string message);
};

bool Session::setup() {
    socket = net::udp_socket();
    if (!socket.is_open()) {
        finish(yeelight::DiscoveryStatus::SocketError, "socket: " + net::last_error());
        return false;
    }

    int reuse = 1;
    setsockopt(socket.fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    auto bind_addr = net::parse_ipv4(options.bind_address);
    if (!bind_addr) {
        finish(yeelight::DiscoveryStatus::SocketError,
               "invalid bind address: " + options.bind_address);
        return false;
    }

    sockaddr_in local = net::make_address(*bind_addr, options.bind_port);
    if (bind(socket.fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        finish(yeelight::DiscoveryStatus::SocketError,
               "bind " + net::to_string(local) + ": " + net::last_error());
        return false;
    }

    // Listening from here on, the window starts now
    std::weak_ptr<Session> weak = shared_from_this();
    auto self = shared_from_this();
    watch_id = loop.watch(socket.fd, POLLIN, [self](short revents) {
        self->on_readable(revents);
    });
    timer_id = loop.add_timer(options.window, [weak]() {
        if (auto self = weak.lock()) {
            self->timer_id = 0;
            self->finish(yeelight::DiscoveryStatus::Ok, {});
        }
    });

    int broadcast = 1;
    if (setsockopt(socket.fd, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
        finish(yeelight::DiscoveryStatus::SocketError, "SO_BROADCAST: " + net::last_error());
        return false;
    }

    int ttl = options.ttl;
    if (setsockopt(socket.fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        finish(yeelight::DiscoveryStatus::SocketError, "IP_MULTICAST_TTL: " + net::last_error());
        return false;
    }

    auto target = net::parse_ipv4(options.target_address);
    if (!target) {
        finish(yeelight::DiscoveryStatus::SocketError,
               "invalid target address: " + options.target_address);
        return false;
    }

    if (IN_MULTICAST(ntohl(target->s_addr))) {
        ip_mreq membership = {};
        membership.imr_multiaddr = *target;
        membership.imr_interface.s_addr = htonl(INADDR_ANY);
        if (setsockopt(socket.fd, IPPROTO_IP, IP_ADD_MEMBERSHIP,
                       &membership, sizeof(membership)) < 0) {
            finish(yeelight::DiscoveryStatus::SocketError,
                   "join " + options.target_address + ": " + net::last_error());
            return false;
        }
    }

    return true;
}

bool Session::send_probe() {
    auto target = net::parse_ipv4(options.target_address);
    sockaddr_in remote = net::make_address(*target, options.target_port);

    std::string payload = yeelight::probe::search_request(
        options.target_address, options.target_port, options.search_target);

    ssize_t sent = sendto(socket.fd, payload.data(), payload.size(), 0,
                          reinterpret_cast<sockaddr*>(&remote), sizeof(remote));
    if (sent < 0) {
        std::string error = net::last_error();
        std::cerr << "ssdp: error sending probe: " << error << std::endl;
        finish(yeelight::DiscoveryStatus::SocketError, "send: " + error);
        return false;
    }

    std::cout << "ssdp: sent " << sent << " bytes to " << net::to_string(remote) << std::endl;
    return true;
}

void Session::on_readable(short revents) {
    if (finished) return;

    if (revents & (POLLIN | POLLERR)) {
        // Drain everything queued on the socket
        std::vector<char> buffer(MAX_DATAGRAM);
        while (true) {
            sockaddr_in from = {};
            socklen_t from_len = sizeof(from);
            ssize_t n = recvfrom(socket.fd, buffer.data(), buffer.size(), 0,
                                 reinterpret_cast<sockaddr*>(&from), &from_len);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                if (errno == EINTR) continue;
                std::string error = net::last_error();
                std::cerr << "ssdp: socket error: " << error << std::endl;
                finish(yeelight::DiscoveryStatus::SocketError, "recv: " + error);
                return;
            }

            std::cout << "ssdp: received " << n << " bytes from " << net::to_string(from)
                      << std::endl;
            result.records.push_back(yeelight::parse::parse_device(
                std::string_view(buffer.data(), static_cast<size_t>(n))));
        }
    }

    if (revents & POLLNVAL) {
        finish(yeelight::DiscoveryStatus::SocketError, "socket closed unexpectedly");
    }
}

void Session::finish(yeelight::DiscoveryStatus status, std::string message) {
    if (finished) return;
    finished = true;

    if (timer_id != 0) {
        loop.cancel_timer(timer_id);
        timer_id = 0;
    }

    // Keep this session alive until on_complete returns
    auto keep = shared_from_this();

    if (watch_id != 0) {
        loop.unwatch(watch_id);
        watch_id = 0;
    }
    socket.close();

    result.status = status;
    result.message = std::move(message);

    std::cout << "ssdp: discovery finished with " << result.records.size() << " record(s)";
    if (status != yeelight::DiscoveryStatus::Ok) {
        std::cout << " (" << yeelight::to_string(status) << ": " << result.message << ")";
    }
    std::cout << std::endl;

    if (on_complete) {
        auto callback = std::move(on_complete);
        callback(std::move(result));
    }
}

} // namespace

void discover(event_loop::Loop& loop, const Options& options, Completion on_complete) {
    auto session = std::make_shared<Session>(loop, options, std::move(on_complete));

    std::cout << "ssdp: discovering devices..." << std::endl;

    if (!session->setup()) {
        return;
    }
    session->send_probe();
}

} // namespace ssdp
