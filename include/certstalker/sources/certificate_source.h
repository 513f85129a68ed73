/**
 * @file certificate_source.h
 * @brief Certificate Transparency source interface
 *
 * One implementation per CT provider translates that provider's HTTP API
 * into canonical CertificateRecords:
 *   - CertSpotterSource: api.certspotter.com issuances API
 *   - CrtShSource: crt.sh JSON output
 */

#pragma once

#include "certstalker/http/http_client.h"
#include "certstalker/model/certificate_record.h"

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

namespace certstalker::sources {

/**
 * @brief Settings shared by the HTTP-backed sources
 */
struct SourceOptions {
    int timeoutSeconds = 30;
    std::string userAgent = "certstalker/1.0";
    int maxPages = 5;           // Only meaningful for paginated providers
};

/**
 * @brief CT provider adapter
 *
 * Implementations are stateless between calls and safe to call from the
 * aggregator's worker threads.
 */
class ICertificateSource {
public:
    virtual ~ICertificateSource() = default;

    /// Stable provider id used for key lookup and provenance ("certspotter")
    virtual std::string id() const = 0;

    /// True if the provider answers without an API key
    virtual bool supportsAnonymous() const = 0;

    /**
     * @brief Fetch every certificate the provider knows for domain and its subdomains
     *
     * @param domain Normalized target domain
     * @param apiKey API key, empty for anonymous access
     * @return Certificate records; an empty vector is a successful "no results"
     * @throws common::AuthException key rejected
     * @throws common::RateLimitException provider throttled the request
     * @throws common::TransportException network failure, timeout or 5xx
     * @throws common::ParseException response does not match the expected schema
     */
    virtual std::vector<model::CertificateRecord> fetch(
        const std::string& domain, const std::string& apiKey) = 0;
};

namespace detail {

/**
 * @brief Map a non-success HTTP outcome to the matching SourceException
 *
 * Returns normally for 2xx responses.
 *
 * @throws common::TransportException no response, 5xx
 * @throws common::AuthException 401, 403
 * @throws common::RateLimitException 429 (Retry-After honoured when numeric)
 * @throws common::ParseException any other status (request rejected as malformed)
 */
void throwForHttpFailure(const std::string& provider, const http::HttpResult& result);

/**
 * @brief Parse a response body as JSON
 * @throws common::ParseException on malformed JSON
 */
Json::Value parseJsonBody(const std::string& provider, const std::string& body);

/**
 * @brief Parse "Retry-After" seconds; HTTP-date forms are ignored
 */
std::optional<int> parseRetryAfter(const std::string& value);

} // namespace detail

} // namespace certstalker::sources
