/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Provides consistent exception types across the enumeration engine.
 * Source adapter errors derive from SourceException so that the
 * aggregator can apply its retry / rotate / skip policy per error kind.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace certstalker::common {

/**
 * @brief Base exception for all certstalker exceptions
 */
class CertStalkerException : public std::runtime_error {
public:
    explicit CertStalkerException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Base for errors raised by a certificate source adapter
 */
class SourceException : public CertStalkerException {
public:
    SourceException(const std::string& provider, const std::string& message)
        : CertStalkerException(provider + ": " + message), provider_(provider) {}

    const std::string& provider() const { return provider_; }

private:
    std::string provider_;
};

/**
 * @brief API key rejected or invalid (non-retryable for that key)
 */
class AuthException : public SourceException {
public:
    AuthException(const std::string& provider, const std::string& message)
        : SourceException(provider, "authentication failed: " + message) {}
};

/**
 * @brief Provider reported throttling (HTTP 429 or quota payload)
 */
class RateLimitException : public SourceException {
public:
    RateLimitException(const std::string& provider, const std::string& message,
                       std::optional<int> retryAfterSeconds = std::nullopt)
        : SourceException(provider, "rate limited: " + message),
          retryAfterSeconds_(retryAfterSeconds) {}

    /// Seconds the provider asked us to wait, if it said so
    std::optional<int> retryAfterSeconds() const { return retryAfterSeconds_; }

private:
    std::optional<int> retryAfterSeconds_;
};

/**
 * @brief Network failure, timeout or server-side (5xx) error
 */
class TransportException : public SourceException {
public:
    TransportException(const std::string& provider, const std::string& message)
        : SourceException(provider, "transport error: " + message) {}
};

/**
 * @brief Provider response does not match the expected schema
 */
class ParseException : public SourceException {
public:
    ParseException(const std::string& provider, const std::string& message)
        : SourceException(provider, "parse error: " + message) {}
};

/**
 * @brief Every key of a provider is cooling down, disabled or busy
 */
class NoKeyAvailableException : public CertStalkerException {
public:
    explicit NoKeyAvailableException(const std::string& provider)
        : CertStalkerException("No API key available for provider " + provider),
          provider_(provider) {}

    const std::string& provider() const { return provider_; }

private:
    std::string provider_;
};

/**
 * @brief No certificate source produced data for the run
 */
class NoDataAvailableException : public CertStalkerException {
public:
    explicit NoDataAvailableException(const std::string& domain)
        : CertStalkerException("No data available: every certificate source failed for " + domain),
          domain_(domain) {}

    const std::string& domain() const { return domain_; }

private:
    std::string domain_;
};

/**
 * @brief Target domain could not be normalized
 */
class InvalidDomainException : public CertStalkerException {
public:
    explicit InvalidDomainException(const std::string& message)
        : CertStalkerException("Invalid domain: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public CertStalkerException {
public:
    explicit ConfigException(const std::string& message)
        : CertStalkerException("Configuration error: " + message) {}
};

} // namespace certstalker::common
