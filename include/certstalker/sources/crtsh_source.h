/**
 * @file crtsh_source.h
 * @brief crt.sh JSON output adapter
 */
#pragma once

#include "certstalker/sources/certificate_source.h"

#include <memory>

namespace certstalker::sources {

/**
 * @brief crt.sh adapter
 *
 * GET /?q=%25.<domain>&output=json. crt.sh has no API keys; a supplied key
 * is ignored. One certificate may appear in several rows (one per matching
 * identity); rows sharing an id are folded into one record.
 */
class CrtShSource : public ICertificateSource {
public:
    static constexpr const char* PROVIDER_ID = "crtsh";
    static constexpr const char* DEFAULT_BASE_URL = "https://crt.sh";

    /**
     * @throws std::invalid_argument if httpClient is nullptr
     */
    CrtShSource(std::shared_ptr<http::IHttpClient> httpClient,
                SourceOptions options,
                std::string baseUrl = DEFAULT_BASE_URL);

    std::string id() const override { return PROVIDER_ID; }
    bool supportsAnonymous() const override { return true; }

    std::vector<model::CertificateRecord> fetch(
        const std::string& domain, const std::string& apiKey) override;

    /**
     * @brief Convert the crt.sh JSON array to records
     * @throws common::ParseException on schema mismatch
     */
    static std::vector<model::CertificateRecord> parseResponse(const Json::Value& root);

private:
    std::shared_ptr<http::IHttpClient> httpClient_;
    SourceOptions options_;
    std::string baseUrl_;
};

} // namespace certstalker::sources
