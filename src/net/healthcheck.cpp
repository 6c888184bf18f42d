#include "launchpad/net/healthcheck.hpp"

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace launchpad::net {

namespace {

using Clock = std::chrono::steady_clock;

class Socket {
    int fd_ = -1;

public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { if (fd_ >= 0) ::close(fd_); }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
};

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Waits for `events` on fd until the deadline. false on timeout or error.
bool wait_for(int fd, short events, Clock::time_point deadline) {
    for (;;) {
        pollfd pfd{fd, events, 0};
        int rc = ::poll(&pfd, 1, remaining_ms(deadline));
        if (rc > 0) return true;
        if (rc == 0) {
            errno = ETIMEDOUT;
            return false;
        }
        if (errno != EINTR) return false;
    }
}

Error probe_error(std::string message) {
    return Error::from_errno(BootError::HealthCheckFailed, std::move(message));
}

expected<Socket, Error> connect_to(const HealthCheckConfig& config, Clock::time_point deadline) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    auto service = std::to_string(config.port);
    int rc = ::getaddrinfo(config.host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        return unexpected(Error(BootError::HealthCheckFailed,
            "cannot resolve " + config.host + ": " + ::gai_strerror(rc)));
    }

    Error last(BootError::HealthCheckFailed, "no address for " + config.host);
    for (auto* ai = results; ai; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                             ai->ai_protocol));
        if (!sock.valid()) {
            last = probe_error("socket");
            continue;
        }

        if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                last = probe_error("connect to " + config.host + ":" + service);
                continue;
            }
            if (!wait_for(sock.get(), POLLOUT, deadline)) {
                last = probe_error("connect to " + config.host + ":" + service);
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            ::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                errno = so_error;
                last = probe_error("connect to " + config.host + ":" + service);
                continue;
            }
        }

        ::freeaddrinfo(results);
        return sock;
    }

    ::freeaddrinfo(results);
    return unexpected(last);
}

} // anonymous namespace

expected<int, Error> parse_status_line(std::string_view line) {
    auto invalid = [&] {
        return unexpected(Error(BootError::HealthCheckFailed,
            "malformed status line: " + std::string(line.substr(0, 64))));
    };

    if (line.substr(0, 5) != "HTTP/") return invalid();

    auto sp = line.find(' ');
    if (sp == std::string_view::npos || line.size() < sp + 4) return invalid();

    auto code = line.substr(sp + 1, 3);
    int status = 0;
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
    if (ec != std::errc{} || ptr != code.data() + code.size()) return invalid();

    // Code must be followed by a space, a line end or nothing
    if (line.size() > sp + 4 && line[sp + 4] != ' ' && line[sp + 4] != '\r') return invalid();
    if (status < 100 || status > 599) return invalid();

    return status;
}

std::string build_probe_request(const HealthCheckConfig& config) {
    std::string req;
    req += "GET " + config.path + " HTTP/1.1\r\n";
    req += "Host: " + config.host + ":" + std::to_string(config.port) + "\r\n";
    req += "User-Agent: launchpad-healthcheck\r\n";
    req += "Accept: */*\r\n";
    req += "Connection: close\r\n";
    req += "\r\n";
    return req;
}

expected<int, Error> probe(const HealthCheckConfig& config) {
    auto deadline = Clock::now() + config.timeout;

    auto sock = connect_to(config, deadline);
    if (!sock) return unexpected(sock.error());

    auto request = build_probe_request(config);
    size_t sent = 0;
    while (sent < request.size()) {
        if (!wait_for(sock->get(), POLLOUT, deadline)) {
            return unexpected(probe_error("send"));
        }
        ssize_t n = ::send(sock->get(), request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return unexpected(probe_error("send"));
        }
        sent += static_cast<size_t>(n);
    }

    // Only the status line matters
    std::string response;
    char buf[512];
    while (response.find("\r\n") == std::string::npos && response.size() < 8192) {
        if (!wait_for(sock->get(), POLLIN, deadline)) {
            return unexpected(probe_error("receive"));
        }
        ssize_t n = ::recv(sock->get(), buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return unexpected(probe_error("receive"));
        }
        if (n == 0) break;
        response.append(buf, static_cast<size_t>(n));
    }

    if (response.empty()) {
        return unexpected(Error(BootError::HealthCheckFailed, "connection closed without response"));
    }

    auto eol = response.find("\r\n");
    return parse_status_line(std::string_view(response).substr(0, eol));
}

} // namespace launchpad::net
