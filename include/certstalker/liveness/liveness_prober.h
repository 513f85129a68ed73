/**
 * @file liveness_prober.h
 * @brief Concurrent liveness probing over hostname x port
 *
 * Every requested endpoint gets exactly one LivenessResult. Checker
 * failures, exceptions and endpoints abandoned at the run deadline are all
 * recorded as reachable=false with a reason.
 */
#pragma once

#include "certstalker/liveness/endpoint_checker.h"
#include "certstalker/model/aggregated_result.h"
#include "certstalker/utils/task_group.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace certstalker::liveness {

/**
 * @brief Spaces out probe starts across all workers
 *
 * A rate of 0 disables pacing.
 */
class RateLimiter {
public:
    explicit RateLimiter(double requestsPerSecond);

    /**
     * @brief Wait for the next slot
     * @return false if the token was cancelled while waiting
     */
    bool wait(const utils::CancellationToken& token);

    double rate() const { return requestsPerSecond_; }

private:
    double requestsPerSecond_;
    std::chrono::steady_clock::duration interval_{};
    std::chrono::steady_clock::time_point next_{};
    std::mutex mutex_;
};

struct ProberOptions {
    size_t workers = 20;        // Maximum simultaneous checks
    double rateLimit = 0.0;     // Checks started per second, 0 = unlimited
};

class LivenessProber {
public:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    /**
     * @throws std::invalid_argument if checker is nullptr
     */
    LivenessProber(std::shared_ptr<IEndpointChecker> checker, ProberOptions options = ProberOptions());

    /**
     * @brief Check every hostname x port pair
     * @param hostnames Hostnames to probe
     * @param ports Ports to probe on each hostname
     * @param deadline Pending checks are abandoned (recorded unreachable) when it passes
     * @return One result per distinct endpoint
     */
    model::LivenessMap probe(const std::vector<std::string>& hostnames,
                             const std::vector<int>& ports,
                             Deadline deadline = std::nullopt);

    const ProberOptions& options() const { return options_; }

private:
    std::shared_ptr<IEndpointChecker> checker_;
    ProberOptions options_;
};

} // namespace certstalker::liveness
