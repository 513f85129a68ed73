/**
 * @file tcp_connector.cpp
 * @brief Non-blocking TCP connect with poll() timeout
 */
#include "certstalker/liveness/tcp_connector.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace certstalker::liveness {

namespace {

/// Closes the descriptor on scope exit
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

/// Thread-safe errno text; liveness workers call this concurrently
std::string errnoText(int err) {
    return std::system_category().message(err);
}

int setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return -1;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/**
 * @return empty string on success, error text otherwise
 */
std::string connectOne(const addrinfo* ai, std::chrono::steady_clock::time_point deadline) {
    SocketGuard sock(socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
    if (sock.get() < 0) {
        return std::string("socket: ") + errnoText(errno);
    }
    if (setNonBlocking(sock.get()) != 0) {
        return std::string("fcntl: ") + errnoText(errno);
    }

    int rc = ::connect(sock.get(), ai->ai_addr, ai->ai_addrlen);
    if (rc == 0) {
        return "";
    }
    if (errno != EINPROGRESS) {
        return errnoText(errno);
    }

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return "timed out";
        }

        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLOUT;
        rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::string("poll: ") + errnoText(errno);
        }
        if (rc == 0) {
            return "timed out";
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
            return std::string("getsockopt: ") + errnoText(errno);
        }
        return soError == 0 ? "" : errnoText(soError);
    }
}

} // anonymous namespace

ConnectResult TcpConnector::connect(const std::string& host, int port,
                                    std::chrono::milliseconds timeout) const {
    ConnectResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    addrinfo* res = nullptr;
    std::string portStr = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        result.error = std::string("resolve: ") + gai_strerror(gai);
        return result;
    }

    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        std::string error = connectOne(ai, deadline);
        if (error.empty()) {
            result.connected = true;
            result.error.clear();
            break;
        }
        result.error = error;
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }
    freeaddrinfo(res);

    spdlog::trace("[TcpConnector] {}:{} -> {}", host, port,
                  result.connected ? "connected" : result.error);
    return result;
}

} // namespace certstalker::liveness
