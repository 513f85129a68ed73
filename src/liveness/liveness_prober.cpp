/**
 * @file liveness_prober.cpp
 * @brief Liveness prober implementation
 */
#include "certstalker/liveness/liveness_prober.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace certstalker::liveness {

// --- RateLimiter Implementation ---

RateLimiter::RateLimiter(double requestsPerSecond)
    : requestsPerSecond_(requestsPerSecond > 0.0 ? requestsPerSecond : 0.0) {
    if (requestsPerSecond_ > 0.0) {
        interval_ = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(1.0 / requestsPerSecond_));
    }
}

bool RateLimiter::wait(const utils::CancellationToken& token) {
    if (requestsPerSecond_ <= 0.0) {
        return !token.isCancelled();
    }

    std::chrono::steady_clock::time_point slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot = std::max(std::chrono::steady_clock::now(), next_);
        next_ = slot + interval_;
    }

    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
        slot - std::chrono::steady_clock::now());
    if (delay.count() <= 0) {
        return !token.isCancelled();
    }
    return token.sleepFor(delay);
}

// --- LivenessProber Implementation ---

LivenessProber::LivenessProber(std::shared_ptr<IEndpointChecker> checker, ProberOptions options)
    : checker_(std::move(checker)), options_(options) {
    if (!checker_) {
        throw std::invalid_argument("EndpointChecker cannot be null");
    }
    if (options_.workers == 0) {
        options_.workers = 1;
    }
}

model::LivenessMap LivenessProber::probe(const std::vector<std::string>& hostnames,
                                         const std::vector<int>& ports,
                                         Deadline deadline) {
    // Duplicate hostnames or ports must not produce duplicate checks
    std::vector<model::EndpointTarget> targets = model::expandTargets(hostnames, ports);
    std::sort(targets.begin(), targets.end());
    targets.erase(std::unique(targets.begin(), targets.end()), targets.end());

    model::LivenessMap results;
    if (targets.empty()) {
        return results;
    }

    spdlog::info("[LivenessProber] Probing {} endpoints with {} workers{}",
                 targets.size(), options_.workers,
                 options_.rateLimit > 0.0 ? " at " + std::to_string(options_.rateLimit) + " req/s" : "");

    auto limiter = std::make_shared<RateLimiter>(options_.rateLimit);
    auto checker = checker_;

    utils::TaskGroup<model::LivenessResult> group(options_.workers);
    for (const auto& target : targets) {
        group.add([checker, limiter, target](const utils::CancellationToken& token) {
            if (!limiter->wait(token)) {
                return model::LivenessResult::unreachable(target, "cancelled: run timeout exceeded");
            }
            return checker->check(target);
        });
    }

    auto outcomes = group.run(deadline);

    size_t reachable = 0;
    for (size_t i = 0; i < targets.size(); ++i) {
        const auto& target = targets[i];
        const auto& outcome = outcomes[i];

        model::LivenessResult result;
        switch (outcome.state) {
            case utils::TaskState::COMPLETED:
                result = *outcome.value;
                break;
            case utils::TaskState::FAILED:
                spdlog::warn("[LivenessProber] Check of {} failed: {}", target.toString(), outcome.error);
                result = model::LivenessResult::unreachable(target, outcome.error);
                break;
            case utils::TaskState::ABANDONED:
                result = model::LivenessResult::unreachable(target, "abandoned: run timeout exceeded");
                break;
        }

        result.endpoint = target;
        if (!result.reachable && !result.error) {
            result.error = "unreachable";
        }
        if (result.reachable) {
            ++reachable;
        }
        results.emplace(target, std::move(result));
    }

    spdlog::info("[LivenessProber] {}/{} endpoints reachable", reachable, results.size());
    return results;
}

} // namespace certstalker::liveness
