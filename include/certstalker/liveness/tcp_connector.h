/**
 * @file tcp_connector.h
 * @brief Bounded-timeout TCP reachability check
 */
#pragma once

#include <chrono>
#include <string>

namespace certstalker::liveness {

struct ConnectResult {
    bool connected = false;
    std::string error;  // errno text, resolver error or "timed out"
};

/**
 * @brief Plain TCP connect with a timeout
 *
 * Resolves host with getaddrinfo and tries every returned address with a
 * non-blocking connect() until one completes or the timeout is spent. The
 * socket is closed right after the handshake.
 */
class TcpConnector {
public:
    virtual ~TcpConnector() = default;

    virtual ConnectResult connect(const std::string& host, int port,
                                  std::chrono::milliseconds timeout) const;
};

} // namespace certstalker::liveness
