#include "control.hpp"
#include "socket.hpp"

#include <protocol/parse.hpp>

#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>

namespace control {

nlohmann::json Result::result() const {
    if (reply.is_object()) {
        auto it = reply.find("result");
        if (it != reply.end() && it->is_array()) {
            return *it;
        }
    }
    return nlohmann::json::array();
}

namespace {

constexpr size_t READ_CHUNK = 1024;

// Unfinished replies larger than this are treated as undecodable
constexpr size_t MAX_REPLY = 64 * 1024;

// One command invocation. The first terminal transition wins, later events are ignored.
struct Session : std::enable_shared_from_this<Session> {
    event_loop::Loop& loop;
    Options options;
    Completion on_complete;
    std::string peer;

    net::Socket socket;
    event_loop::WatchId watch_id = 0;
    event_loop::TimerId timer_id = 0;
    State state = State::Idle;

    std::string outgoing;
    size_t written = 0;
    std::string incoming;

    Session(event_loop::Loop& loop, Options options, Completion on_complete)
        : loop(loop), options(std::move(options)), on_complete(std::move(on_complete)) {}

    bool terminal() const {
        return state == State::Succeeded || state == State::Failed || state == State::TimedOut;
    }

    void start(const sockaddr_in& remote);
    void on_event(short revents);
    void on_connected();
    void flush();
    void read_reply();
    bool consume_lines(bool eof);
    void complete(yeelight::CommandStatus status, std::string message, nlohmann::json reply = {});
};

void Session::start(const sockaddr_in& remote) {
    socket = net::tcp_socket();
    if (!socket.is_open()) {
        complete(yeelight::CommandStatus::ConnectError, "socket: " + net::last_error());
        return;
    }

    state = State::Connecting;

    std::weak_ptr<Session> weak = shared_from_this();
    timer_id = loop.add_timer(options.deadline, [weak]() {
        if (auto self = weak.lock()) {
            self->timer_id = 0;
            self->complete(yeelight::CommandStatus::TimedOut,
                           "no reply within " + std::to_string(self->options.deadline.count()) + " ms");
        }
    });

    int ret = ::connect(socket.fd, reinterpret_cast<const sockaddr*>(&remote), sizeof(remote));
    if (ret < 0 && errno != EINPROGRESS) {
        complete(yeelight::CommandStatus::ConnectError, "connect: " + net::last_error());
        return;
    }

    auto self = shared_from_this();
    watch_id = loop.watch(socket.fd, POLLOUT, [self](short revents) {
        self->on_event(revents);
    });
}

void Session::on_event(short revents) {
    if (terminal()) return;

    if (state == State::Connecting) {
        if (revents & (POLLOUT | POLLERR | POLLHUP)) {
            int err = 0;
            socklen_t len = sizeof(err);
            if (getsockopt(socket.fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
                err = errno;
            }
            if (err != 0) {
                complete(yeelight::CommandStatus::ConnectError,
                         std::string("connect: ") + strerror(err));
                return;
            }
            on_connected();
        }
        return;
    }

    if (revents & POLLOUT) {
        flush();
        if (terminal()) return;
    }

    if (revents & (POLLIN | POLLHUP | POLLERR)) {
        read_reply();
    }
}

void Session::on_connected() {
    std::cout << "control: connected to " << peer << std::endl;
    state = State::AwaitingReply;
    flush();
}

void Session::flush() {
    while (written < outgoing.size()) {
        ssize_t n = ::send(socket.fd, outgoing.data() + written, outgoing.size() - written,
                           MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            complete(yeelight::CommandStatus::ConnectError, "send: " + net::last_error());
            return;
        }
        written += static_cast<size_t>(n);
    }

    short events = POLLIN;
    if (written < outgoing.size()) events |= POLLOUT;
    loop.modify(watch_id, events);
}

void Session::read_reply() {
    char buffer[READ_CHUNK];
    while (!terminal()) {
        ssize_t n = ::recv(socket.fd, buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            complete(yeelight::CommandStatus::ConnectError, "recv: " + net::last_error());
            return;
        }

        if (n == 0) {
            if (!consume_lines(true)) {
                complete(yeelight::CommandStatus::DecodeError, "connection closed before reply");
            }
            return;
        }

        incoming.append(buffer, static_cast<size_t>(n));
        if (consume_lines(false)) return;

        if (incoming.size() > MAX_REPLY) {
            complete(yeelight::CommandStatus::DecodeError, "reply too large");
            return;
        }
    }
}

// Returns true once the session reached a terminal state
bool Session::consume_lines(bool eof) {
    while (!terminal()) {
        size_t end = incoming.find('\n');
        std::string line;
        if (end != std::string::npos) {
            line = incoming.substr(0, end);
            incoming.erase(0, end + 1);
        } else if (eof || yeelight::parse::classify_reply(incoming) !=
                              yeelight::parse::Framing::Partial) {
            // Unterminated object, or bytes that can never become one
            if (yeelight::parse::trim(incoming).empty()) return false;
            line = std::move(incoming);
            incoming.clear();
        } else {
            return false;
        }

        if (yeelight::parse::trim(line).empty()) continue;

        auto reply = yeelight::parse::decode_reply(line);
        if (!reply) {
            std::cerr << "control: undecodable reply from " << peer << ": " << line << std::endl;
            complete(yeelight::CommandStatus::DecodeError, "invalid JSON reply: " + line);
            return true;
        }

        if (yeelight::parse::is_notification(*reply)) {
            continue;
        }

        auto id = yeelight::parse::reply_id(*reply);
        if (id && *id != options.request_id) {
            std::cout << "control: ignoring reply with id " << *id << " from " << peer << std::endl;
            continue;
        }

        complete(yeelight::CommandStatus::Succeeded, {}, std::move(*reply));
        return true;
    }
    return true;
}

void Session::complete(yeelight::CommandStatus status, std::string message,
                       nlohmann::json reply) {
    if (terminal()) return;

    switch (status) {
        case yeelight::CommandStatus::Succeeded: state = State::Succeeded; break;
        case yeelight::CommandStatus::TimedOut: state = State::TimedOut; break;
        default: state = State::Failed; break;
    }

    // Keep this session alive until on_complete returns
    auto keep = shared_from_this();

    if (timer_id != 0) {
        loop.cancel_timer(timer_id);
        timer_id = 0;
    }
    if (watch_id != 0) {
        loop.unwatch(watch_id);
        watch_id = 0;
    }
    socket.close();

    if (status != yeelight::CommandStatus::Succeeded) {
        std::cerr << "control: " << peer << ": " << yeelight::to_string(status)
                  << ": " << message << std::endl;
    }

    Result result;
    result.status = status;
    result.message = std::move(message);
    result.reply = std::move(reply);

    if (on_complete) {
        auto callback = std::move(on_complete);
        callback(std::move(result));
    }
}

} // namespace

void send(event_loop::Loop& loop, std::string_view address,
          const yeelight::commands::Command& command, Completion on_complete,
          const Options& options) {
    auto fail = [&](std::string message) {
        std::cerr << "control: " << message << std::endl;
        Result result;
        result.status = yeelight::CommandStatus::PreconditionError;
        result.message = std::move(message);
        if (on_complete) on_complete(std::move(result));
    };

    if (address.empty()) {
        fail("missing device address");
        return;
    }

    auto endpoint = yeelight::parse::parse_location(address);
    if (!endpoint) {
        fail("invalid device address: " + std::string(address));
        return;
    }

    auto host = net::parse_ipv4(endpoint->host);
    if (!host) {
        fail("device host is not an IPv4 address: " + endpoint->host);
        return;
    }

    auto session = std::make_shared<Session>(loop, options, std::move(on_complete));
    session->peer = endpoint->host + ":" + std::to_string(endpoint->port);
    session->outgoing = yeelight::commands::serialize(command, options.request_id);
    session->start(net::make_address(*host, endpoint->port));
}

} // namespace control
