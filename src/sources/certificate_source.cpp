/**
 * @file certificate_source.cpp
 * @brief HTTP status and JSON helpers shared by certificate sources
 */

#include "certstalker/sources/certificate_source.h"
#include "certstalker/common/exceptions.h"
#include "certstalker/utils/string_utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace certstalker::sources::detail {

std::optional<int> parseRetryAfter(const std::string& value) {
    std::string trimmed = utils::trim(value);
    if (trimmed.empty() || trimmed.size() > 9 ||
        !std::all_of(trimmed.begin(), trimmed.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::stoi(trimmed);
}

void throwForHttpFailure(const std::string& provider, const http::HttpResult& result) {
    if (!result.received) {
        throw common::TransportException(provider, result.error.empty() ? "no response" : result.error);
    }

    int status = result.statusCode;
    if (status >= 200 && status < 300) {
        return;
    }

    std::string what = "HTTP " + std::to_string(status);
    if (status == 401 || status == 403) {
        throw common::AuthException(provider, what);
    }
    if (status == 429) {
        std::optional<int> retryAfter;
        if (auto header = result.header("Retry-After")) {
            retryAfter = parseRetryAfter(*header);
        }
        throw common::RateLimitException(provider, what, retryAfter);
    }
    if (status >= 500) {
        throw common::TransportException(provider, what);
    }
    throw common::ParseException(provider, "unexpected " + what);
}

Json::Value parseJsonBody(const std::string& provider, const std::string& body) {
    Json::Value root;
    Json::CharReaderBuilder reader;
    std::istringstream iss(body);
    std::string errs;

    if (!Json::parseFromStream(reader, iss, &root, &errs)) {
        throw common::ParseException(provider, "invalid JSON: " + utils::trim(errs));
    }
    return root;
}

} // namespace certstalker::sources::detail
