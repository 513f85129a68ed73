/**
 * @file endpoint_checker.cpp
 * @brief HTTPS / HTTP / TCP reachability check
 */
#include "certstalker/liveness/endpoint_checker.h"
#include "certstalker/utils/string_utils.h"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <vector>

namespace certstalker::liveness {

HttpEndpointChecker::HttpEndpointChecker(std::shared_ptr<http::IHttpClient> httpClient,
                                         std::shared_ptr<TcpConnector> tcpConnector,
                                         CheckerOptions options)
    : httpClient_(std::move(httpClient)),
      tcpConnector_(std::move(tcpConnector)),
      options_(std::move(options)) {
    if (!httpClient_) {
        throw std::invalid_argument("HttpClient cannot be null");
    }
    if (!tcpConnector_) {
        throw std::invalid_argument("TcpConnector cannot be null");
    }
}

std::optional<model::LivenessResult> HttpEndpointChecker::tryHttp(
    const model::EndpointTarget& endpoint, const std::string& scheme, std::string& failure) {
    http::HttpRequest request;
    request.url = scheme + "://" + endpoint.hostname + ":" + std::to_string(endpoint.port) + "/";
    request.timeoutSeconds = options_.timeoutSeconds;
    if (!options_.userAgent.empty()) {
        request.headers["User-Agent"] = options_.userAgent;
    }

    http::HttpResult response = httpClient_->get(request);
    if (!response.received) {
        failure = scheme + ": " + (response.error.empty() ? "no response" : response.error);
        return std::nullopt;
    }

    model::LivenessResult result;
    result.endpoint = endpoint;
    result.reachable = true;
    result.checkedAt = std::chrono::system_clock::now();
    result.protocol = scheme;
    result.statusCode = response.statusCode;
    return result;
}

model::LivenessResult HttpEndpointChecker::check(const model::EndpointTarget& endpoint) {
    std::vector<std::string> failures;
    std::string failure;

    for (const char* scheme : {"https", "http"}) {
        auto result = tryHttp(endpoint, scheme, failure);
        if (result) {
            spdlog::debug("[EndpointChecker] {} reachable over {} (status {})",
                          endpoint.toString(), scheme, result->statusCode.value_or(0));
            return *result;
        }
        failures.push_back(failure);
    }

    if (options_.tcpFallback) {
        ConnectResult connected = tcpConnector_->connect(
            endpoint.hostname, endpoint.port, std::chrono::seconds(options_.timeoutSeconds));
        if (connected.connected) {
            spdlog::debug("[EndpointChecker] {} reachable over tcp", endpoint.toString());
            model::LivenessResult result;
            result.endpoint = endpoint;
            result.reachable = true;
            result.checkedAt = std::chrono::system_clock::now();
            result.protocol = "tcp";
            return result;
        }
        failures.push_back("tcp: " + connected.error);
    }

    std::string reason = utils::join(failures, "; ");
    spdlog::debug("[EndpointChecker] {} unreachable: {}", endpoint.toString(), reason);
    return model::LivenessResult::unreachable(endpoint, reason);
}

} // namespace certstalker::liveness
