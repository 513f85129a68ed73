/**
 * @file aggregated_result.h
 * @brief Final result of one enumeration run
 */
#pragma once

#include "certstalker/model/certificate_record.h"
#include "certstalker/model/endpoint.h"
#include "certstalker/model/hostname_set.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace certstalker::model {

/// How a certificate source fared during the run
enum class ProviderStatus {
    OK,       ///< Returned at least one certificate
    EMPTY,    ///< Answered successfully with zero certificates
    FAILED,   ///< Every attempt failed (partial failure of the run)
    SKIPPED   ///< No usable key and no anonymous access
};

inline std::string providerStatusToString(ProviderStatus s) {
    switch (s) {
        case ProviderStatus::OK:      return "OK";
        case ProviderStatus::EMPTY:   return "EMPTY";
        case ProviderStatus::FAILED:  return "FAILED";
        case ProviderStatus::SKIPPED: return "SKIPPED";
    }
    return "UNKNOWN";
}

/**
 * @brief Per-provider annotation; FAILED/SKIPPED entries are the run's partial failures
 */
struct ProviderReport {
    std::string provider;
    ProviderStatus status = ProviderStatus::FAILED;
    int attempts = 0;
    size_t certificateCount = 0;
    size_t hostnameCount = 0;
    std::string error;  // Last error for FAILED/SKIPPED

    bool succeeded() const {
        return status == ProviderStatus::OK || status == ProviderStatus::EMPTY;
    }
};

using LivenessMap = std::map<EndpointTarget, LivenessResult>;

/**
 * @brief Immutable outcome of Aggregator::enumerate()
 */
class AggregatedResult {
public:
    AggregatedResult(
        const std::string& runId,
        const std::string& domain,
        std::chrono::system_clock::time_point generatedAt,
        std::vector<CertificateRecord> certificates,
        HostnameSet hostnames,
        std::vector<ProviderReport> providerReports,
        std::vector<int> ports,
        std::optional<LivenessMap> liveliness
    )
        : runId_(runId), domain_(domain), generatedAt_(generatedAt),
          certificates_(std::move(certificates)), hostnames_(std::move(hostnames)),
          providerReports_(std::move(providerReports)), ports_(std::move(ports)),
          liveliness_(std::move(liveliness))
    {}

    const std::string& getRunId() const { return runId_; }
    const std::string& getDomain() const { return domain_; }
    std::chrono::system_clock::time_point getGeneratedAt() const { return generatedAt_; }
    const std::vector<CertificateRecord>& getCertificates() const { return certificates_; }
    const HostnameSet& getHostnames() const { return hostnames_; }
    const std::vector<ProviderReport>& getProviderReports() const { return providerReports_; }
    const std::vector<int>& getPorts() const { return ports_; }
    const std::optional<LivenessMap>& getLiveliness() const { return liveliness_; }

    /// True when at least one provider failed or was skipped
    bool hasPartialFailure() const {
        for (const auto& report : providerReports_) {
            if (!report.succeeded()) return true;
        }
        return false;
    }

private:
    std::string runId_;
    std::string domain_;
    std::chrono::system_clock::time_point generatedAt_;
    std::vector<CertificateRecord> certificates_;
    HostnameSet hostnames_;
    std::vector<ProviderReport> providerReports_;
    std::vector<int> ports_;                    // Ports requested for the run
    std::optional<LivenessMap> liveliness_;     // Present only when liveness was checked
};

} // namespace certstalker::model
