/**
 * @file endpoint.h
 * @brief Liveness probe targets and their results
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace certstalker::model {

/**
 * @brief hostname:port pair checked by the liveness prober
 */
struct EndpointTarget {
    std::string hostname;
    int port = 0;

    std::string toString() const { return hostname + ":" + std::to_string(port); }

    bool operator<(const EndpointTarget& other) const {
        return std::tie(hostname, port) < std::tie(other.hostname, other.port);
    }
    bool operator==(const EndpointTarget& other) const {
        return hostname == other.hostname && port == other.port;
    }
};

/**
 * @brief Outcome of checking one endpoint, written once per target
 */
struct LivenessResult {
    EndpointTarget endpoint;
    bool reachable = false;
    std::chrono::system_clock::time_point checkedAt;
    std::optional<std::string> error;   // Set whenever reachable is false
    std::string protocol;               // "https", "http" or "tcp" when reachable
    std::optional<int> statusCode;      // HTTP status when an HTTP answer came back

    /**
     * @brief Unreachable result carrying a reason
     */
    static LivenessResult unreachable(const EndpointTarget& endpoint, const std::string& reason) {
        LivenessResult result;
        result.endpoint = endpoint;
        result.reachable = false;
        result.checkedAt = std::chrono::system_clock::now();
        result.error = reason.empty() ? std::string("unreachable") : reason;
        return result;
    }
};

/**
 * @brief Cartesian product hostnames x ports, in hostname then port-list order
 */
inline std::vector<EndpointTarget> expandTargets(const std::vector<std::string>& hostnames,
                                                 const std::vector<int>& ports) {
    std::vector<EndpointTarget> targets;
    targets.reserve(hostnames.size() * ports.size());
    for (const auto& hostname : hostnames) {
        for (int port : ports) {
            targets.push_back(EndpointTarget{hostname, port});
        }
    }
    return targets;
}

} // namespace certstalker::model
