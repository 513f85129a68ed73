/**
 * @file config.cpp
 * @brief Run configuration loading and validation
 */

#include "certstalker/common/config.h"
#include "certstalker/common/exceptions.h"
#include "certstalker/utils/string_utils.h"

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace certstalker::common {

namespace {

int envInt(const char* name, int current) {
    const char* env = std::getenv(name);
    if (!env || std::string(env).empty()) {
        return current;
    }
    try {
        return std::stoi(env);
    } catch (const std::exception&) {
        throw ConfigException(std::string(name) + " is not an integer: " + env);
    }
}

} // anonymous namespace

const std::vector<int>& Config::defaultPorts() {
    static const std::vector<int> ports = {443, 80, 8443};
    return ports;
}

std::vector<int> Config::probePorts() const {
    std::vector<int> ports;
    for (int port : defaultPorts()) {
        ports.push_back(port);
    }
    for (int port : extraPorts) {
        if (std::find(ports.begin(), ports.end(), port) == ports.end()) {
            ports.push_back(port);
        }
    }
    return ports;
}

std::string Config::effectiveLogLevel() const {
    if (!logLevel.empty()) {
        return logLevel;
    }
    return debug ? "debug" : "info";
}

void Config::loadFromEnv() {
    if (auto e = std::getenv("CERTSTALKER_CERTSPOTTER_KEYS")) {
        auto keys = parseKeyList(e);
        if (!keys.empty()) apiKeys["certspotter"] = keys;
    }
    if (auto e = std::getenv("CERTSTALKER_CRTSH_KEYS")) {
        auto keys = parseKeyList(e);
        if (!keys.empty()) apiKeys["crtsh"] = keys;
    }
    httpTimeoutSeconds = envInt("CERTSTALKER_HTTP_TIMEOUT", httpTimeoutSeconds);
    probeTimeoutSeconds = envInt("CERTSTALKER_PROBE_TIMEOUT", probeTimeoutSeconds);
    probeWorkers = envInt("CERTSTALKER_PROBE_WORKERS", probeWorkers);
    runTimeoutSeconds = envInt("CERTSTALKER_RUN_TIMEOUT", runTimeoutSeconds);
    if (auto e = std::getenv("CERTSTALKER_LOG_LEVEL")) logLevel = e;
}

void Config::loadKeysFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigException("cannot open key file " + path);
    }

    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errs;
    if (!Json::parseFromStream(reader, in, &root, &errs)) {
        throw ConfigException("key file " + path + " is not valid JSON: " + errs);
    }
    if (!root.isObject()) {
        throw ConfigException("key file " + path + " must contain a JSON object");
    }

    for (const auto& provider : root.getMemberNames()) {
        const Json::Value& list = root[provider];
        if (!list.isArray()) {
            throw ConfigException("keys for provider '" + provider + "' must be an array");
        }
        std::vector<std::string> keys;
        for (const auto& key : list) {
            if (!key.isString()) {
                throw ConfigException("keys for provider '" + provider + "' must be strings");
            }
            std::string value = utils::trim(key.asString());
            if (!value.empty()) {
                keys.push_back(value);
            }
        }
        apiKeys[utils::toLowerCase(provider)] = keys;
        spdlog::debug("[Config] Loaded {} key(s) for provider {}", keys.size(), provider);
    }
}

void Config::validate() const {
    if (domains.empty()) {
        throw ConfigException("no target domain given");
    }
    if (outputFormat != OutputFormat::DETAILED && outputFormat != OutputFormat::ENDPOINTS_ONLY) {
        throw ConfigException("output format must be 1 (detailed) or 2 (endpoints-only)");
    }
    for (int port : extraPorts) {
        if (port < 1 || port > 65535) {
            throw ConfigException("port out of range: " + std::to_string(port));
        }
    }
    if (probeWorkers < 1) {
        throw ConfigException("probe worker count must be at least 1");
    }
    if (probeTimeoutSeconds < 1 || httpTimeoutSeconds < 1) {
        throw ConfigException("timeouts must be at least 1 second");
    }
    if (probeRateLimit < 0.0) {
        throw ConfigException("rate limit cannot be negative");
    }
    if (maxFetchAttempts < 1) {
        throw ConfigException("max fetch attempts must be at least 1");
    }
    if (certSpotterMaxPages < 1) {
        throw ConfigException("CertSpotter page cap must be at least 1");
    }
    if (keyBaseBackoffSeconds < 0 || keyMaxBackoffSeconds < keyBaseBackoffSeconds) {
        throw ConfigException("key backoff window is invalid");
    }
    if (maxConcurrentPerKey < 1) {
        throw ConfigException("concurrent requests per key must be at least 1");
    }
    if (runTimeoutSeconds < 0) {
        throw ConfigException("run timeout cannot be negative");
    }
    if (!proxyUrl.empty() && !utils::startsWith(proxyUrl, "http://")) {
        throw ConfigException("only http:// proxies are supported: " + proxyUrl);
    }
}

std::vector<int> parsePortList(const std::string& csv) {
    std::vector<int> ports;
    for (const auto& part : utils::split(csv, ',')) {
        std::string token = utils::trim(part);
        if (token.empty()) {
            continue;
        }
        if (!std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })
            || token.size() > 5) {
            throw ConfigException("invalid port: " + token);
        }
        int port = std::stoi(token);
        if (port < 1 || port > 65535) {
            throw ConfigException("port out of range: " + token);
        }
        ports.push_back(port);
    }
    return ports;
}

std::vector<std::string> parseKeyList(const std::string& csv) {
    std::vector<std::string> keys;
    for (const auto& part : utils::split(csv, ',')) {
        std::string key = utils::trim(part);
        if (!key.empty()) {
            keys.push_back(key);
        }
    }
    return keys;
}

} // namespace certstalker::common
