/**
 * @file time.hpp
 * @brief Cross-platform time helpers used for ledger and audit timestamps
 */

#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace migrate::compat {

/**
 * @brief Cross-platform thread-safe UTC time conversion
 *
 * @param time Pointer to the time_t value to convert
 * @param result Pointer to the tm structure to store the result
 * @return Pointer to the tm structure (result) on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Format a time point as "YYYY-MM-DD HH:MM:SS" (UTC)
 *
 * An epoch (default constructed) time point yields an empty string.
 */
[[nodiscard]] inline std::string to_timestamp_string(
    std::chrono::system_clock::time_point tp) {
    if (tp == std::chrono::system_clock::time_point{}) {
        return "";
    }
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (gmtime_safe(&time, &tm) == nullptr) {
        return "";
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

/**
 * @brief Parse a "YYYY-MM-DD HH:MM:SS" UTC timestamp
 *
 * @return Parsed time point, or the epoch when the string is malformed
 */
[[nodiscard]] inline std::chrono::system_clock::time_point
from_timestamp_string(const std::string& str) {
    if (str.empty()) {
        return {};
    }
    std::tm tm{};
    if (std::sscanf(str.c_str(), "%d-%d-%d %d:%d:%d", &tm.tm_year,
                    &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min,
                    &tm.tm_sec) < 6) {
        return {};
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
#ifdef _WIN32
    auto time = _mkgmtime(&tm);
#else
    auto time = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(time);
}

}  // namespace migrate::compat
