/**
 * @file crtsh_source.cpp
 * @brief crt.sh adapter implementation
 */
#include "certstalker/sources/crtsh_source.h"
#include "certstalker/common/exceptions.h"
#include "certstalker/utils/string_utils.h"
#include "certstalker/utils/time_utils.h"

#include <spdlog/spdlog.h>

#include <map>
#include <set>
#include <stdexcept>

namespace certstalker::sources {

namespace {

struct PendingRecord {
    std::string id;
    std::string issuer;
    std::optional<std::chrono::system_clock::time_point> notBefore;
    std::optional<std::chrono::system_clock::time_point> notAfter;
    std::set<std::string> names;
};

void addNames(std::set<std::string>& names, const std::string& field) {
    // name_value lists one identity per line
    for (const auto& line : utils::split(field, '\n')) {
        std::string value = utils::toLowerCase(utils::trim(line));
        if (!value.empty()) {
            names.insert(value);
        }
    }
}

std::string idOf(const Json::Value& entry) {
    if (!entry.isMember("id")) {
        return "";
    }
    const Json::Value& id = entry["id"];
    if (id.isIntegral()) {
        return std::to_string(id.asLargestInt());
    }
    return id.isString() ? id.asString() : "";
}

} // anonymous namespace

CrtShSource::CrtShSource(std::shared_ptr<http::IHttpClient> httpClient,
                         SourceOptions options,
                         std::string baseUrl)
    : httpClient_(std::move(httpClient)),
      options_(std::move(options)),
      baseUrl_(std::move(baseUrl)) {
    if (!httpClient_) {
        throw std::invalid_argument("HttpClient cannot be null");
    }
}

std::vector<model::CertificateRecord> CrtShSource::fetch(const std::string& domain,
                                                         const std::string& /*apiKey*/) {
    spdlog::debug("[CrtShSource] Fetching data from crt.sh for {}", domain);

    http::HttpRequest request;
    request.url = baseUrl_ + "/?q=" + utils::urlEncode("%." + domain) + "&output=json";
    request.timeoutSeconds = options_.timeoutSeconds;
    request.headers["User-Agent"] = options_.userAgent;
    request.headers["Accept"] = "application/json";

    http::HttpResult result = httpClient_->get(request);
    detail::throwForHttpFailure(PROVIDER_ID, result);

    // crt.sh answers an unknown domain with an empty body on some mirrors
    if (utils::trim(result.body).empty()) {
        spdlog::info("[CrtShSource] Empty response for {}", domain);
        return {};
    }

    auto records = parseResponse(detail::parseJsonBody(PROVIDER_ID, result.body));
    spdlog::info("[CrtShSource] Found {} certificates for {}", records.size(), domain);
    return records;
}

std::vector<model::CertificateRecord> CrtShSource::parseResponse(const Json::Value& root) {
    if (!root.isArray()) {
        throw common::ParseException(PROVIDER_ID, "expected a JSON array of certificates");
    }

    std::vector<PendingRecord> pending;
    std::map<std::string, size_t> indexById;

    try {
        for (const auto& entry : root) {
            if (!entry.isObject()) {
                throw common::ParseException(PROVIDER_ID, "certificate entry is not an object");
            }
            if (entry.isMember("name_value") && !entry["name_value"].isString()) {
                throw common::ParseException(PROVIDER_ID, "name_value is not a string");
            }

            std::string id = idOf(entry);
            PendingRecord* record = nullptr;
            auto it = id.empty() ? indexById.end() : indexById.find(id);
            if (it != indexById.end()) {
                record = &pending[it->second];
            } else {
                PendingRecord fresh;
                fresh.id = id;
                fresh.issuer = entry.get("issuer_name", "").asString();
                if (entry.isMember("not_before") && entry["not_before"].isString()) {
                    fresh.notBefore = utils::parseIso8601(entry["not_before"].asString());
                }
                if (entry.isMember("not_after") && entry["not_after"].isString()) {
                    fresh.notAfter = utils::parseIso8601(entry["not_after"].asString());
                }
                pending.push_back(std::move(fresh));
                if (!id.empty()) {
                    indexById[id] = pending.size() - 1;
                }
                record = &pending.back();
            }

            addNames(record->names, entry.get("name_value", "").asString());
            if (entry.isMember("common_name") && entry["common_name"].isString()) {
                addNames(record->names, entry["common_name"].asString());
            }
        }
    } catch (const Json::Exception& e) {
        // Field present with the wrong JSON type
        throw common::ParseException(PROVIDER_ID, std::string("unexpected field type: ") + e.what());
    }

    std::vector<model::CertificateRecord> records;
    records.reserve(pending.size());
    for (auto& p : pending) {
        records.emplace_back(PROVIDER_ID, p.id, p.issuer, p.notBefore, p.notAfter, std::move(p.names));
    }
    return records;
}

} // namespace certstalker::sources
