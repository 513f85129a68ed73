/**
 * @file time_utils.cpp
 * @brief ISO 8601 conversion utilities implementation
 */

#include "certstalker/utils/time_utils.h"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace certstalker::utils {

std::string formatIso8601(const std::chrono::system_clock::time_point& tp,
                          bool includeMilliseconds) {
    std::time_t timeValue = std::chrono::system_clock::to_time_t(tp);

    struct tm tmTime;
    if (!gmtime_r(&timeValue, &tmTime)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec;

    if (includeMilliseconds) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000;
        if (ms < 0) ms += 1000;
        oss << '.' << std::setw(3) << ms;
    }

    oss << 'Z';
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& iso8601) {
    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));

    int consumed = 0;
    char separator = 0;
    int scanned = std::sscanf(iso8601.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                              &tmTime.tm_year, &tmTime.tm_mon, &tmTime.tm_mday,
                              &separator,
                              &tmTime.tm_hour, &tmTime.tm_min, &tmTime.tm_sec,
                              &consumed);
    if (scanned != 7 || (separator != 'T' && separator != ' ')) {
        return std::nullopt;
    }
    if (tmTime.tm_mon < 1 || tmTime.tm_mon > 12 || tmTime.tm_mday < 1 || tmTime.tm_mday > 31 ||
        tmTime.tm_hour > 23 || tmTime.tm_min > 59 || tmTime.tm_sec > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    long long millis = 0;

    // Fractional seconds: keep milliseconds, ignore finer digits
    if (pos < iso8601.size() && iso8601[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < iso8601.size() && std::isdigit(static_cast<unsigned char>(iso8601[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (iso8601[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    long offsetSeconds = 0;
    if (pos < iso8601.size()) {
        char zone = iso8601[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int offHour = 0;
            int offMin = 0;
            if (std::sscanf(iso8601.c_str() + pos + 1, "%2d:%2d", &offHour, &offMin) != 2) {
                return std::nullopt;
            }
            offsetSeconds = (offHour * 3600L + offMin * 60L) * (zone == '+' ? 1 : -1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != iso8601.size()) {
        return std::nullopt;
    }

    tmTime.tm_year -= 1900;
    tmTime.tm_mon -= 1;
    tmTime.tm_isdst = 0;

    std::time_t t = timegm(&tmTime);
    if (t == -1) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(t - offsetSeconds) +
           std::chrono::milliseconds(millis);
}

} // namespace certstalker::utils
