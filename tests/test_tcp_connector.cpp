/**
 * @file test_tcp_connector.cpp
 * @brief TcpConnector against loopback sockets
 */

#include <gtest/gtest.h>
#include <certstalker/liveness/tcp_connector.h>

#include <cerrno>
#include <system_error>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace certstalker::liveness;
using namespace std::chrono;

namespace {

/// Loopback socket bound to an ephemeral port, listening or not
class LoopbackSocket {
public:
    explicit LoopbackSocket(bool listening) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (fd_ >= 0 && ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
            socklen_t len = sizeof(addr);
            if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
                port_ = ntohs(addr.sin_port);
            }
            if (listening) {
                ::listen(fd_, 4);
            }
        }
    }

    ~LoopbackSocket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    LoopbackSocket(const LoopbackSocket&) = delete;
    LoopbackSocket& operator=(const LoopbackSocket&) = delete;

    int port() const { return port_; }

private:
    int fd_ = -1;
    int port_ = 0;
};

} // anonymous namespace

TEST(TcpConnectorTest, ConnectsToListeningPort) {
    LoopbackSocket server(true);
    ASSERT_GT(server.port(), 0);

    TcpConnector connector;
    auto result = connector.connect("127.0.0.1", server.port(), milliseconds(2000));
    EXPECT_TRUE(result.connected) << result.error;
    EXPECT_TRUE(result.error.empty());
}

TEST(TcpConnectorTest, ClosedPortRefused) {
    // Bound but not listening: connections are refused
    LoopbackSocket bound(false);
    ASSERT_GT(bound.port(), 0);

    TcpConnector connector;
    auto result = connector.connect("127.0.0.1", bound.port(), milliseconds(2000));
    EXPECT_FALSE(result.connected);
    EXPECT_EQ(result.error, std::system_category().message(ECONNREFUSED));
}

TEST(TcpConnectorTest, ConcurrentFailuresKeepTheirOwnErrorText) {
    LoopbackSocket bound(false);
    ASSERT_GT(bound.port(), 0);

    TcpConnector connector;
    std::vector<ConnectResult> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i]() {
            results[i] = connector.connect("127.0.0.1", bound.port(), milliseconds(2000));
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& result : results) {
        EXPECT_FALSE(result.connected);
        EXPECT_EQ(result.error, std::system_category().message(ECONNREFUSED));
    }
}

TEST(TcpConnectorTest, UnresolvableHost) {
    TcpConnector connector;
    auto result = connector.connect("does-not-exist.invalid", 443, milliseconds(2000));
    EXPECT_FALSE(result.connected);
    EXPECT_EQ(result.error.rfind("resolve:", 0), 0u);
}
