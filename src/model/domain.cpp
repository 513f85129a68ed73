/**
 * @file domain.cpp
 * @brief Domain and hostname normalization
 */

#include "certstalker/model/domain.h"
#include "certstalker/common/exceptions.h"
#include "certstalker/utils/string_utils.h"

#include <cctype>

namespace certstalker::model {

std::string normalizeDomain(const std::string& input) {
    std::string value = utils::trim(input);

    size_t schemePos = value.find("://");
    if (schemePos != std::string::npos) {
        value = value.substr(schemePos + 3);
    }

    size_t pathPos = value.find_first_of("/?#");
    if (pathPos != std::string::npos) {
        value = value.substr(0, pathPos);
    }

    size_t userPos = value.rfind('@');
    if (userPos != std::string::npos) {
        value = value.substr(userPos + 1);
    }

    size_t portPos = value.find(':');
    if (portPos != std::string::npos) {
        value = value.substr(0, portPos);
    }

    while (!value.empty() && value.back() == '.') {
        value.pop_back();
    }

    value = utils::toLowerCase(value);

    if (value.empty()) {
        throw common::InvalidDomainException("'" + input + "' is empty after normalization");
    }
    if (!isValidHostname(value)) {
        throw common::InvalidDomainException("'" + input + "' is not a valid DNS name");
    }
    return value;
}

bool isValidHostname(const std::string& hostname) {
    if (hostname.empty() || hostname.size() > 253) {
        return false;
    }

    size_t labelStart = 0;
    while (labelStart <= hostname.size()) {
        size_t dot = hostname.find('.', labelStart);
        size_t labelEnd = (dot == std::string::npos) ? hostname.size() : dot;
        size_t labelLen = labelEnd - labelStart;

        if (labelLen == 0 || labelLen > 63) {
            return false;
        }
        if (hostname[labelStart] == '-' || hostname[labelEnd - 1] == '-') {
            return false;
        }
        for (size_t i = labelStart; i < labelEnd; ++i) {
            unsigned char c = static_cast<unsigned char>(hostname[i]);
            if (!std::isalnum(c) && c != '-') {
                return false;
            }
        }

        if (dot == std::string::npos) {
            break;
        }
        labelStart = dot + 1;
    }
    return true;
}

bool isWildcard(const std::string& name) {
    return utils::startsWith(utils::trim(name), "*.");
}

std::optional<std::string> normalizeHostname(const std::string& name) {
    std::string value = utils::toLowerCase(utils::trim(name));
    while (!value.empty() && value.back() == '.') {
        value.pop_back();
    }
    if (!isValidHostname(value)) {
        return std::nullopt;
    }
    return value;
}

bool isInScope(const std::string& hostname, const std::string& domain) {
    return hostname == domain || utils::endsWith(hostname, "." + domain);
}

} // namespace certstalker::model
