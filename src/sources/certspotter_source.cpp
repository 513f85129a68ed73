/**
 * @file certspotter_source.cpp
 * @brief CertSpotter issuances API adapter implementation
 */
#include "certstalker/sources/certspotter_source.h"
#include "certstalker/common/exceptions.h"
#include "certstalker/utils/string_utils.h"
#include "certstalker/utils/time_utils.h"

#include <spdlog/spdlog.h>

#include <set>
#include <sstream>
#include <stdexcept>

namespace certstalker::sources {

namespace {

std::optional<std::chrono::system_clock::time_point> timeField(const Json::Value& entry,
                                                               const char* name) {
    if (!entry.isMember(name) || !entry[name].isString()) {
        return std::nullopt;
    }
    return utils::parseIso8601(entry[name].asString());
}

/**
 * @brief Error payloads look like {"code": "rate_limited", "message": "..."}
 *
 * Only quota and credential codes are recognised; any other payload returns
 * normally and the HTTP status decides.
 */
void throwForErrorPayload(const Json::Value& root) {
    if (!root.isObject() || !root["code"].isString()) {
        return;
    }
    std::string code = root["code"].asString();
    std::string message = root["message"].isString() ? root["message"].asString() : code;

    if (code == "rate_limited" || code == "quota_exceeded") {
        throw common::RateLimitException(CertSpotterSource::PROVIDER_ID, message);
    }
    if (code == "unauthorized" || code == "not_authorized" || code == "invalid_api_key") {
        throw common::AuthException(CertSpotterSource::PROVIDER_ID, message);
    }
}

model::CertificateRecord parseIssuance(const Json::Value& entry) {
    const std::string provider = CertSpotterSource::PROVIDER_ID;
    if (!entry.isObject()) {
        throw common::ParseException(provider, "issuance entry is not an object");
    }

    std::string id = entry.get("id", "").asString();

    std::set<std::string> names;
    if (entry.isMember("dns_names")) {
        const Json::Value& dnsNames = entry["dns_names"];
        if (!dnsNames.isArray()) {
            throw common::ParseException(provider, "dns_names is not an array");
        }
        for (const auto& name : dnsNames) {
            if (!name.isString()) continue;
            std::string value = utils::toLowerCase(utils::trim(name.asString()));
            if (!value.empty()) names.insert(value);
        }
    }

    std::string issuer;
    if (entry.isMember("issuer") && entry["issuer"].isObject()) {
        const Json::Value& issuerObj = entry["issuer"];
        issuer = issuerObj.get("name", "").asString();
        if (issuer.empty()) {
            issuer = issuerObj.get("friendly_name", "").asString();
        }
    }

    return model::CertificateRecord(provider, id, issuer,
                                    timeField(entry, "not_before"), timeField(entry, "not_after"),
                                    std::move(names));
}

} // anonymous namespace

CertSpotterSource::CertSpotterSource(std::shared_ptr<http::IHttpClient> httpClient,
                                     SourceOptions options,
                                     std::string baseUrl)
    : httpClient_(std::move(httpClient)),
      options_(std::move(options)),
      baseUrl_(std::move(baseUrl)) {
    if (!httpClient_) {
        throw std::invalid_argument("HttpClient cannot be null");
    }
}

std::string CertSpotterSource::buildUrl(const std::string& domain, const std::string& after) const {
    std::string url = baseUrl_ + "/v1/issuances?domain=" + utils::urlEncode(domain) +
                      "&include_subdomains=true&expand=dns_names&expand=issuer";
    if (!after.empty()) {
        url += "&after=" + utils::urlEncode(after);
    }
    return url;
}

std::vector<model::CertificateRecord> CertSpotterSource::fetch(const std::string& domain,
                                                               const std::string& apiKey) {
    spdlog::debug("[CertSpotterSource] Fetching issuances for {} ({})",
                  domain, utils::keyFingerprint(apiKey));

    std::vector<model::CertificateRecord> records;
    std::string after;

    for (int page = 0; page < options_.maxPages; ++page) {
        http::HttpRequest request;
        request.url = buildUrl(domain, after);
        request.timeoutSeconds = options_.timeoutSeconds;
        request.headers["User-Agent"] = options_.userAgent;
        request.headers["Accept"] = "application/json";
        if (!apiKey.empty()) {
            request.headers["Authorization"] = "Bearer " + apiKey;
        }

        http::HttpResult result = httpClient_->get(request);

        // A JSON error payload is more specific than the bare status code
        if (result.received && (result.statusCode < 200 || result.statusCode >= 300)) {
            Json::Value errorBody;
            Json::CharReaderBuilder reader;
            std::istringstream iss(result.body);
            std::string errs;
            if (result.statusCode != 401 && result.statusCode != 403 && result.statusCode != 429 &&
                Json::parseFromStream(reader, iss, &errorBody, &errs)) {
                throwForErrorPayload(errorBody);
            }
        }
        detail::throwForHttpFailure(PROVIDER_ID, result);

        Json::Value root = detail::parseJsonBody(PROVIDER_ID, result.body);
        throwForErrorPayload(root);

        auto pageRecords = parsePage(root);
        spdlog::debug("[CertSpotterSource] Page {}: {} issuances", page + 1, pageRecords.size());
        if (pageRecords.empty()) {
            break;
        }

        after = pageRecords.back().getSourceId();
        for (auto& record : pageRecords) {
            records.push_back(std::move(record));
        }
        if (after.empty()) {
            break;
        }
    }

    spdlog::info("[CertSpotterSource] Found {} certificates for {}", records.size(), domain);
    return records;
}

std::vector<model::CertificateRecord> CertSpotterSource::parsePage(const Json::Value& page) {
    if (!page.isArray()) {
        throw common::ParseException(PROVIDER_ID, "expected a JSON array of issuances");
    }

    std::vector<model::CertificateRecord> records;
    records.reserve(page.size());

    try {
        for (const auto& entry : page) {
            records.push_back(parseIssuance(entry));
        }
    } catch (const Json::Exception& e) {
        // Field present with the wrong JSON type
        throw common::ParseException(PROVIDER_ID, std::string("unexpected field type: ") + e.what());
    }

    return records;
}

} // namespace certstalker::sources
