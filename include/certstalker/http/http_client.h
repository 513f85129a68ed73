/**
 * @file http_client.h
 * @brief HTTP client for certificate providers and liveness probes
 */
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace trantor {
class EventLoopThread;
}

namespace certstalker::http {

/**
 * @brief Outgoing GET request
 */
struct HttpRequest {
    std::string url;                              // Absolute http:// or https:// URL
    std::map<std::string, std::string> headers;
    int timeoutSeconds = 10;
};

/**
 * @brief Result of a GET request
 *
 * received is false when no HTTP response arrived (DNS failure, refused
 * connection, TLS handshake failure, timeout); error then says why.
 */
struct HttpResult {
    bool received = false;
    int statusCode = 0;
    std::string body;
    std::map<std::string, std::string> headers;   // Lowercase header names
    std::string error;
    bool timedOut = false;
    bool handshakeFailed = false;

    /// Header value by case-insensitive name
    std::optional<std::string> header(const std::string& name) const;
};

/**
 * @brief HTTP GET abstraction
 *
 * Certificate sources and the liveness checker depend on this interface;
 * tests substitute canned responses.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Perform a GET request (synchronous)
     *
     * Never throws for network-level failures; they are reported in the result.
     */
    virtual HttpResult get(const HttpRequest& request) = 0;
};

/**
 * @brief Drogon-backed HTTP client
 *
 * Owns a private event loop thread so it can be used outside a running
 * drogon application. Requests are sent asynchronously on that loop and
 * awaited with a promise/future pair. Safe to call from many threads.
 */
class HttpClient : public IHttpClient {
public:
    /**
     * @param proxyUrl Optional forward proxy ("http://host:port"); requests are
     *                 sent to it in absolute-form
     * @param validateCert Verify TLS certificates (disabled for liveness probes)
     */
    explicit HttpClient(const std::string& proxyUrl = "", bool validateCert = true);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResult get(const HttpRequest& request) override;

    /**
     * @brief Split URL into scheme://host[:port] and path (with query)
     * @return {origin, path}, or std::nullopt if the URL is not http(s)
     */
    static std::optional<std::pair<std::string, std::string>> splitUrl(const std::string& url);

private:
    std::unique_ptr<trantor::EventLoopThread> loopThread_;
    std::string proxyUrl_;
    bool validateCert_;
};

} // namespace certstalker::http
