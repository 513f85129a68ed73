/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used across certstalker modules.
 */

#pragma once

#include <string>
#include <vector>

namespace certstalker::utils {

/**
 * @brief Convert string to lowercase (ASCII)
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLowerCase(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * "a,b," produces ["a", "b", ""]; an empty input produces [""].
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return Vector of string parts
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Join strings with delimiter
 *
 * @param parts Vector of strings
 * @param delimiter Delimiter string
 * @return Joined string
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

/**
 * @brief Check if string starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Check if string ends with suffix
 */
bool endsWith(const std::string& str, const std::string& suffix);

/**
 * @brief Percent-encode a URL query component (RFC 3986 unreserved set kept)
 */
std::string urlEncode(const std::string& str);

/**
 * @brief Short, log-safe identifier for an API key
 *
 * Returns "key#" followed by the first 8 hex digits of SHA-256(key),
 * or "anonymous" for an empty key. The key itself never appears.
 *
 * @param apiKey API key
 * @return Fingerprint label
 */
std::string keyFingerprint(const std::string& apiKey);

} // namespace certstalker::utils
