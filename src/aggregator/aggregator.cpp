/**
 * @file aggregator.cpp
 * @brief Aggregator implementation
 */
#include "certstalker/aggregator/aggregator.h"
#include "certstalker/common/exceptions.h"
#include "certstalker/model/domain.h"
#include "certstalker/utils/string_utils.h"
#include "certstalker/utils/time_utils.h"
#include "certstalker/utils/run_id.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace certstalker::aggregator {

namespace {

std::chrono::milliseconds transportDelay(const AggregatorOptions& options, int attempt) {
    auto delay = options.retryDelay;
    for (int i = 1; i < attempt && delay < options.maxRetryDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, options.maxRetryDelay);
}

} // anonymous namespace

AggregatorOptions AggregatorOptions::fromConfig(const common::Config& config) {
    AggregatorOptions options;
    options.maxAttempts = config.maxFetchAttempts;
    options.ports = config.probePorts();
    options.checkLiveness = config.checkLiveness;
    options.runTimeout = std::chrono::seconds(config.runTimeoutSeconds);
    return options;
}

Aggregator::Aggregator(std::vector<std::shared_ptr<sources::ICertificateSource>> sources,
                       std::shared_ptr<keys::KeyRateManager> keyManager,
                       AggregatorOptions options,
                       std::shared_ptr<liveness::LivenessProber> prober)
    : sources_(std::move(sources)),
      keyManager_(std::move(keyManager)),
      options_(std::move(options)),
      prober_(std::move(prober)) {
    if (!keyManager_) {
        throw std::invalid_argument("KeyRateManager cannot be null");
    }
    for (const auto& source : sources_) {
        if (!source) {
            throw std::invalid_argument("Certificate source cannot be null");
        }
    }
    if (options_.checkLiveness && !prober_) {
        throw std::invalid_argument("LivenessProber is required when liveness checking is enabled");
    }
    if (options_.maxAttempts < 1) {
        options_.maxAttempts = 1;
    }
}

SourceRun Aggregator::runSource(const std::shared_ptr<sources::ICertificateSource>& source,
                                const std::shared_ptr<keys::KeyRateManager>& keyManager,
                                const AggregatorOptions& options,
                                const std::string& domain,
                                const utils::CancellationToken& token) {
    SourceRun run;
    const std::string provider = source->id();
    run.report.provider = provider;
    run.report.status = model::ProviderStatus::FAILED;

    while (run.report.attempts < options.maxAttempts) {
        if (token.isCancelled()) {
            run.report.error = "cancelled: run timeout exceeded";
            break;
        }

        std::optional<keys::ApiKeyLease> lease;
        try {
            lease.emplace(keyManager->acquire(provider));
        } catch (const common::NoKeyAvailableException& e) {
            if (!source->supportsAnonymous()) {
                spdlog::warn("[Aggregator] Skipping {}: {}", provider, e.what());
                run.report.status = model::ProviderStatus::SKIPPED;
                if (run.report.error.empty()) {
                    run.report.error = e.what();
                }
                return run;
            }
        }
        const std::string key = lease ? lease->key() : "";
        const std::string who = utils::keyFingerprint(key);

        run.report.attempts++;
        spdlog::debug("[Aggregator] {} attempt {}/{} ({})",
                      provider, run.report.attempts, options.maxAttempts, who);

        try {
            run.records = source->fetch(domain, key);
            if (lease) {
                keyManager->report(provider, key, keys::KeyOutcome::SUCCESS);
            }
            run.report.status = run.records.empty() ? model::ProviderStatus::EMPTY
                                                    : model::ProviderStatus::OK;
            run.report.certificateCount = run.records.size();
            run.report.error.clear();
            return run;

        } catch (const common::AuthException& e) {
            run.report.error = e.what();
            if (lease) {
                keyManager->report(provider, key, keys::KeyOutcome::AUTH_REJECTED);
                continue;
            }
            // Anonymous access refused
            break;

        } catch (const common::RateLimitException& e) {
            run.report.error = e.what();
            if (lease) {
                keyManager->report(provider, key, keys::KeyOutcome::RATE_LIMITED,
                                   e.retryAfterSeconds());
                continue;
            }
            auto wait = e.retryAfterSeconds()
                ? std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::seconds(*e.retryAfterSeconds()))
                : transportDelay(options, run.report.attempts);
            wait = std::min(wait, options.maxRetryDelay);
            if (run.report.attempts < options.maxAttempts && !token.sleepFor(wait)) {
                run.report.error = "cancelled: run timeout exceeded";
                break;
            }

        } catch (const common::TransportException& e) {
            run.report.error = e.what();
            if (lease) {
                keyManager->report(provider, key, keys::KeyOutcome::TRANSPORT_FAILURE);
            }
            if (run.report.attempts < options.maxAttempts &&
                !token.sleepFor(transportDelay(options, run.report.attempts))) {
                run.report.error = "cancelled: run timeout exceeded";
                break;
            }

        } catch (const common::ParseException& e) {
            run.report.error = e.what();
            if (lease) {
                keyManager->report(provider, key, keys::KeyOutcome::PARSE_FAILURE);
            }
            break;

        } catch (const std::exception& e) {
            run.report.error = std::string("unexpected error: ") + e.what();
            break;
        }
    }

    spdlog::warn("[Aggregator] {} failed after {} attempt(s): {}",
                 provider, run.report.attempts, run.report.error);
    return run;
}

model::HostnameSet Aggregator::collectHostnames(const std::vector<model::CertificateRecord>& records,
                                                const std::string& provider,
                                                const std::string& domain) {
    model::HostnameSet set;
    for (const auto& record : records) {
        for (const auto& san : record.getSubjectAlternativeNames()) {
            if (model::isWildcard(san)) {
                continue;
            }
            auto hostname = model::normalizeHostname(san);
            if (!hostname || !model::isInScope(*hostname, domain)) {
                continue;
            }
            set.add(*hostname, provider);
        }
    }
    return set;
}

model::AggregatedResult Aggregator::enumerate(const std::string& domain, Deadline deadline) {
    const std::string target = model::normalizeDomain(domain);
    const std::string runId = utils::generateRunId();

    if (!deadline && options_.runTimeout.count() > 0) {
        deadline = std::chrono::steady_clock::now() + options_.runTimeout;
    }

    spdlog::info("[Aggregator] Run {}: enumerating {} with {} source(s)",
                 runId, target, sources_.size());

    // Tasks capture shared collaborators by value; an abandoned task may outlive this call
    utils::TaskGroup<SourceRun> group(sources_.size());
    for (const auto& source : sources_) {
        auto keyManager = keyManager_;
        auto options = options_;
        group.add([source, keyManager, options, target](const utils::CancellationToken& token) {
            return runSource(source, keyManager, options, target, token);
        });
    }
    auto outcomes = group.run(deadline);

    std::vector<model::CertificateRecord> certificates;
    std::vector<model::ProviderReport> reports;
    model::HostnameSet hostnames;
    bool anySucceeded = false;

    for (size_t i = 0; i < sources_.size(); ++i) {
        auto& outcome = outcomes[i];
        SourceRun run;
        if (outcome.state == utils::TaskState::COMPLETED) {
            run = std::move(*outcome.value);
        } else {
            run.report.provider = sources_[i]->id();
            run.report.status = model::ProviderStatus::FAILED;
            run.report.error = outcome.state == utils::TaskState::ABANDONED
                ? "abandoned: run timeout exceeded"
                : outcome.error;
            spdlog::warn("[Aggregator] {} did not complete: {}", run.report.provider, run.report.error);
        }

        if (run.report.succeeded()) {
            anySucceeded = true;
            model::HostnameSet found = collectHostnames(run.records, run.report.provider, target);
            run.report.hostnameCount = found.size();
            hostnames.merge(found);
            for (auto& record : run.records) {
                certificates.push_back(std::move(record));
            }
            spdlog::info("[Aggregator] {}: {} certificates, {} in-scope hostnames",
                         run.report.provider, run.report.certificateCount, run.report.hostnameCount);
        }
        reports.push_back(std::move(run.report));
    }

    if (!anySucceeded) {
        spdlog::error("[Aggregator] Run {}: every source failed for {}", runId, target);
        throw common::NoDataAvailableException(target);
    }

    spdlog::info("[Aggregator] Run {}: {} certificates, {} unique hostnames",
                 runId, certificates.size(), hostnames.size());

    std::optional<model::LivenessMap> liveliness;
    if (options_.checkLiveness) {
        liveliness = prober_->probe(hostnames.hostnames(), options_.ports, deadline);
    }

    return model::AggregatedResult(runId, target, utils::now(), std::move(certificates),
                                   std::move(hostnames), std::move(reports),
                                   options_.ports, std::move(liveliness));
}

} // namespace certstalker::aggregator
