/**
 * @file time_utils.hpp
 * @brief Timestamp formatting and parsing (ISO-8601, UTC)
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>
#include <chrono>

namespace warden {
namespace utils {

/**
 * @class TimeUtils
 * @brief Static helpers for audit timestamps
 */
class TimeUtils {
public:
    /// `2025-01-01T12:00:00.000Z`
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

    /// `20250101120000`, used in generated ids
    static std::string FormatCompact(const std::chrono::system_clock::time_point& time);

    /**
     * @brief Parse `YYYY-MM-DDTHH:MM:SS[.mmm][Z]` (a space may replace `T`)
     * @return nullopt when the text does not match
     */
    static std::optional<std::chrono::system_clock::time_point> ParseTimestamp(const std::string& text);

    static std::chrono::system_clock::time_point FromEpochMillis(long long millis);
    static long long ToEpochMillis(const std::chrono::system_clock::time_point& time);
};

} // namespace utils
} // namespace warden
