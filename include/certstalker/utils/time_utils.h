/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * ISO 8601 formatting and parsing for provider timestamps and report stamps.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace certstalker::utils {

/**
 * @brief Format time_point as ISO 8601 string (UTC)
 *
 * @param tp std::chrono time_point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-02-02T12:34:56Z")
 */
std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMilliseconds = false
);

/**
 * @brief Parse ISO 8601 string to time_point
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with an optional fractional part and an
 * optional "Z" or "+HH:MM"/"-HH:MM" offset. A space may replace the "T".
 * Strings without an offset are taken as UTC.
 *
 * @param iso8601 ISO 8601 formatted string
 * @return std::chrono time_point, or std::nullopt on error
 */
std::optional<std::chrono::system_clock::time_point> parseIso8601(
    const std::string& iso8601
);

/**
 * @brief Get current time as time_point
 */
inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

} // namespace certstalker::utils
