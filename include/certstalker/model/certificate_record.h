#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>

namespace certstalker::model {

/**
 * @brief Canonical certificate record produced by a certificate source
 *
 * Built once from one provider response entry and never modified.
 * subjectAlternativeNames holds the names as the provider listed them,
 * lowercased; wildcard and out-of-scope names are kept here even though
 * they never become hostname entries.
 */
class CertificateRecord {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    CertificateRecord(
        const std::string& provider,
        const std::string& sourceId,
        const std::string& issuer,
        std::optional<TimePoint> notBefore,
        std::optional<TimePoint> notAfter,
        std::set<std::string> subjectAlternativeNames
    )
        : provider_(provider), sourceId_(sourceId), issuer_(issuer),
          notBefore_(notBefore), notAfter_(notAfter),
          subjectAlternativeNames_(std::move(subjectAlternativeNames))
    {}

    // Getters
    const std::string& getProvider() const { return provider_; }
    const std::string& getSourceId() const { return sourceId_; }
    const std::string& getIssuer() const { return issuer_; }
    const std::optional<TimePoint>& getNotBefore() const { return notBefore_; }
    const std::optional<TimePoint>& getNotAfter() const { return notAfter_; }
    const std::set<std::string>& getSubjectAlternativeNames() const { return subjectAlternativeNames_; }

private:
    std::string provider_;                        // Provider id (certspotter, crtsh)
    std::string sourceId_;                        // Provider's own record id
    std::string issuer_;                          // Issuer DN or friendly name
    std::optional<TimePoint> notBefore_;
    std::optional<TimePoint> notAfter_;
    std::set<std::string> subjectAlternativeNames_;
};

} // namespace certstalker::model
