/**
 * @file certspotter_source.h
 * @brief SSLMate CertSpotter issuances API adapter
 */
#pragma once

#include "certstalker/sources/certificate_source.h"

#include <memory>

namespace certstalker::sources {

/**
 * @brief CertSpotter v1 issuances adapter
 *
 * GET /v1/issuances?domain=<d>&include_subdomains=true&expand=dns_names&expand=issuer
 * with "Authorization: Bearer <key>" when a key is supplied. Results are
 * paged with the "after" cursor (id of the last issuance seen).
 */
class CertSpotterSource : public ICertificateSource {
public:
    static constexpr const char* PROVIDER_ID = "certspotter";
    static constexpr const char* DEFAULT_BASE_URL = "https://api.certspotter.com";

    /**
     * @param httpClient HTTP client (shared)
     * @param options Timeout, user agent, page cap
     * @param baseUrl API origin
     * @throws std::invalid_argument if httpClient is nullptr
     */
    CertSpotterSource(std::shared_ptr<http::IHttpClient> httpClient,
                      SourceOptions options,
                      std::string baseUrl = DEFAULT_BASE_URL);

    std::string id() const override { return PROVIDER_ID; }
    bool supportsAnonymous() const override { return true; }

    std::vector<model::CertificateRecord> fetch(
        const std::string& domain, const std::string& apiKey) override;

    /**
     * @brief Convert one issuances page to records
     * @throws common::ParseException on schema mismatch or a quota/auth error payload
     */
    static std::vector<model::CertificateRecord> parsePage(const Json::Value& page);

private:
    std::string buildUrl(const std::string& domain, const std::string& after) const;

    std::shared_ptr<http::IHttpClient> httpClient_;
    SourceOptions options_;
    std::string baseUrl_;
};

} // namespace certstalker::sources
