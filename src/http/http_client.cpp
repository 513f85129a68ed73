/**
 * @file http_client.cpp
 * @brief HTTP client implementation
 */
#include "certstalker/http/http_client.h"
#include "certstalker/utils/string_utils.h"

#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <trantor/net/EventLoopThread.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <regex>

namespace certstalker::http {

namespace {

std::string reqResultToString(drogon::ReqResult result) {
    switch (result) {
        case drogon::ReqResult::Ok:                 return "ok";
        case drogon::ReqResult::BadResponse:        return "bad response";
        case drogon::ReqResult::NetworkFailure:     return "network failure";
        case drogon::ReqResult::BadServerAddress:   return "bad server address";
        case drogon::ReqResult::Timeout:            return "timeout";
        case drogon::ReqResult::HandshakeError:     return "TLS handshake error";
        case drogon::ReqResult::InvalidCertificate: return "invalid certificate";
        case drogon::ReqResult::EncryptionFailure:  return "encryption failure";
    }
    return "unknown error";
}

} // anonymous namespace

std::optional<std::string> HttpResult::header(const std::string& name) const {
    auto it = headers.find(utils::toLowerCase(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

HttpClient::HttpClient(const std::string& proxyUrl, bool validateCert)
    : loopThread_(std::make_unique<trantor::EventLoopThread>("certstalker-http")),
      proxyUrl_(proxyUrl),
      validateCert_(validateCert) {
    loopThread_->run();
    if (!proxyUrl_.empty()) {
        spdlog::debug("[HttpClient] Using proxy {}", proxyUrl_);
    }
}

HttpClient::~HttpClient() = default;

std::optional<std::pair<std::string, std::string>> HttpClient::splitUrl(const std::string& url) {
    // Matches: http://host, https://host:port/path?query
    static const std::regex urlRegex(R"(^(https?://[^/?#]+)([^#]*))", std::regex::icase);
    std::smatch match;

    if (!std::regex_search(url, match, urlRegex)) {
        return std::nullopt;
    }

    std::string origin = match.str(1);
    std::string path = match.str(2);
    if (path.empty()) {
        path = "/";
    } else if (path[0] == '?') {
        path = "/" + path;
    }
    return std::make_pair(origin, path);
}

HttpResult HttpClient::get(const HttpRequest& request) {
    HttpResult result;

    auto parts = splitUrl(request.url);
    if (!parts) {
        result.error = "invalid URL: " + request.url;
        spdlog::error("[HttpClient] {}", result.error);
        return result;
    }
    const auto& [origin, path] = *parts;

    spdlog::trace("[HttpClient] GET {}", request.url);

    // Through a proxy the request line carries the absolute URL
    bool viaProxy = !proxyUrl_.empty();
    auto client = drogon::HttpClient::newHttpClient(
        viaProxy ? proxyUrl_ : origin, loopThread_->getLoop(), false, validateCert_);

    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPathEncode(false);
    req->setPath(viaProxy ? request.url : path);
    if (viaProxy) {
        req->addHeader("Host", origin.substr(origin.find("://") + 3));
    }

    for (const auto& [name, value] : request.headers) {
        if (utils::toLowerCase(name) == "user-agent") {
            client->setUserAgent(value);
        } else {
            req->addHeader(name, value);
        }
    }

    // Shared so that a late callback never touches a destroyed promise
    auto promise = std::make_shared<std::promise<HttpResult>>();
    auto future = promise->get_future();

    client->sendRequest(req, [promise](drogon::ReqResult reqResult,
                                       const drogon::HttpResponsePtr& response) {
        HttpResult r;
        if (reqResult == drogon::ReqResult::Ok && response) {
            r.received = true;
            r.statusCode = static_cast<int>(response->getStatusCode());
            r.body = std::string(response->getBody());
            for (const auto& [name, value] : response->headers()) {
                r.headers[utils::toLowerCase(name)] = value;
            }
        } else {
            r.error = reqResultToString(reqResult);
            r.timedOut = reqResult == drogon::ReqResult::Timeout;
            r.handshakeFailed = reqResult == drogon::ReqResult::HandshakeError ||
                                reqResult == drogon::ReqResult::InvalidCertificate ||
                                reqResult == drogon::ReqResult::EncryptionFailure;
        }
        promise->set_value(std::move(r));
    }, static_cast<double>(request.timeoutSeconds));

    // Drogon enforces the timeout; the grace period only guards a stuck loop
    if (future.wait_for(std::chrono::seconds(request.timeoutSeconds + 5)) == std::future_status::timeout) {
        result.error = "timeout";
        result.timedOut = true;
        spdlog::debug("[HttpClient] Request to {} timed out after {} seconds",
                      origin, request.timeoutSeconds);
        return result;
    }

    result = future.get();
    if (!result.received) {
        spdlog::debug("[HttpClient] Request to {} failed: {}", origin, result.error);
    }
    return result;
}

} // namespace certstalker::http
