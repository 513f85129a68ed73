/**
 * @file endpoint_checker.h
 * @brief Single-endpoint reachability check
 */
#pragma once

#include "certstalker/http/http_client.h"
#include "certstalker/liveness/tcp_connector.h"
#include "certstalker/model/endpoint.h"

#include <memory>
#include <string>

namespace certstalker::liveness {

/**
 * @brief Checks one hostname:port
 *
 * Implementations must report every failure in the returned result
 * (reachable=false plus an error reason) rather than throwing.
 */
class IEndpointChecker {
public:
    virtual ~IEndpointChecker() = default;

    virtual model::LivenessResult check(const model::EndpointTarget& endpoint) = 0;
};

struct CheckerOptions {
    int timeoutSeconds = 5;
    std::string userAgent;
    bool tcpFallback = true;    // Disabled when probing through a proxy
};

/**
 * @brief HTTPS first, then plain HTTP, then a bare TCP connect
 *
 * Any HTTP response, whatever its status, counts as reachable. The TCP step
 * covers services that speak neither protocol.
 */
class HttpEndpointChecker : public IEndpointChecker {
public:
    /**
     * @param httpClient Client used for both HTTP attempts (certificate checks off)
     * @param tcpConnector Connector for the TCP fallback
     * @param options Timeout, user agent, fallback switch
     * @throws std::invalid_argument if a collaborator is nullptr
     */
    HttpEndpointChecker(std::shared_ptr<http::IHttpClient> httpClient,
                        std::shared_ptr<TcpConnector> tcpConnector,
                        CheckerOptions options);

    model::LivenessResult check(const model::EndpointTarget& endpoint) override;

private:
    std::optional<model::LivenessResult> tryHttp(const model::EndpointTarget& endpoint,
                                                 const std::string& scheme,
                                                 std::string& failure);

    std::shared_ptr<http::IHttpClient> httpClient_;
    std::shared_ptr<TcpConnector> tcpConnector_;
    CheckerOptions options_;
};

} // namespace certstalker::liveness
