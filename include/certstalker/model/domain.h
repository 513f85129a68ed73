/**
 * @file domain.h
 * @brief Domain and hostname normalization rules
 */
#pragma once

#include <optional>
#include <string>

namespace certstalker::model {

/**
 * @brief Normalize the root input domain
 *
 * Trims whitespace, strips a URL scheme, user info, path, query, port and a
 * trailing dot, and lowercases the rest.
 * "HTTPS://Example.COM:8443/login" becomes "example.com".
 *
 * @param input Domain as supplied by the caller
 * @return Normalized domain
 * @throws common::InvalidDomainException if nothing valid remains
 */
std::string normalizeDomain(const std::string& input);

/**
 * @brief Check DNS label syntax (LDH labels, 1..63 chars each, <= 253 total)
 */
bool isValidHostname(const std::string& hostname);

/// True for names such as "*.example.com"
bool isWildcard(const std::string& name);

/**
 * @brief Canonical form of a certificate name: trimmed, lowercased, no trailing dot
 *
 * @return Canonical hostname, or std::nullopt when the result is not a valid
 *         hostname (wildcards, e-mail addresses, empty strings)
 */
std::optional<std::string> normalizeHostname(const std::string& name);

/**
 * @brief True if hostname equals domain or is a subdomain of it
 */
bool isInScope(const std::string& hostname, const std::string& domain);

} // namespace certstalker::model
