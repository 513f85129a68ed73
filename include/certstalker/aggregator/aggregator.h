/**
 * @file aggregator.h
 * @brief Enumeration engine: source fan-out, retry policy, merge
 *
 * enumerate() runs every certificate source concurrently, each under the
 * retry / key rotation / anonymous fallback policy, merges the in-scope
 * SAN hostnames of all successful sources into one HostnameSet and, when
 * configured, probes the merged hostnames for liveness.
 */
#pragma once

#include "certstalker/common/config.h"
#include "certstalker/keys/key_rate_manager.h"
#include "certstalker/liveness/liveness_prober.h"
#include "certstalker/model/aggregated_result.h"
#include "certstalker/sources/certificate_source.h"
#include "certstalker/utils/task_group.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace certstalker::aggregator {

struct AggregatorOptions {
    int maxAttempts = 3;                                    // Fetch attempts per source
    std::chrono::milliseconds retryDelay{500};              // First transport retry delay
    std::chrono::milliseconds maxRetryDelay{5000};          // Cap for anonymous waits
    std::vector<int> ports = common::Config::defaultPorts();
    bool checkLiveness = false;
    std::chrono::seconds runTimeout{0};                     // 0 = no deadline

    /**
     * @brief Derive options from the run configuration
     */
    static AggregatorOptions fromConfig(const common::Config& config);
};

/// Outcome of one source for one run
struct SourceRun {
    model::ProviderReport report;
    std::vector<model::CertificateRecord> records;
};

class Aggregator {
public:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    /**
     * @param sources Certificate sources, in output order
     * @param keyManager Key pool shared by all sources
     * @param options Retry, port and liveness settings
     * @param prober Liveness prober, required when options.checkLiveness is set
     * @throws std::invalid_argument on a null collaborator
     */
    Aggregator(std::vector<std::shared_ptr<sources::ICertificateSource>> sources,
               std::shared_ptr<keys::KeyRateManager> keyManager,
               AggregatorOptions options,
               std::shared_ptr<liveness::LivenessProber> prober = nullptr);

    /**
     * @brief Enumerate certificates and hostnames for domain
     *
     * @param domain Target domain (normalized here)
     * @param deadline Absolute run deadline; defaults to now + options.runTimeout
     * @return Immutable aggregated result, possibly with failed providers
     * @throws common::InvalidDomainException domain cannot be normalized
     * @throws common::NoDataAvailableException no source succeeded
     */
    model::AggregatedResult enumerate(const std::string& domain, Deadline deadline = std::nullopt);

    /**
     * @brief Run one source under the retry / rotation policy
     *
     * Never throws: every failure ends up in the report.
     */
    static SourceRun runSource(const std::shared_ptr<sources::ICertificateSource>& source,
                               const std::shared_ptr<keys::KeyRateManager>& keyManager,
                               const AggregatorOptions& options,
                               const std::string& domain,
                               const utils::CancellationToken& token);

    /**
     * @brief In-scope, non-wildcard SAN hostnames of records, attributed to provider
     */
    static model::HostnameSet collectHostnames(const std::vector<model::CertificateRecord>& records,
                                               const std::string& provider,
                                               const std::string& domain);

private:
    std::vector<std::shared_ptr<sources::ICertificateSource>> sources_;
    std::shared_ptr<keys::KeyRateManager> keyManager_;
    AggregatorOptions options_;
    std::shared_ptr<liveness::LivenessProber> prober_;
};

} // namespace certstalker::aggregator
