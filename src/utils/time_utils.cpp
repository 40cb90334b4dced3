/**
 * @file time_utils.cpp
 * @brief Implementation of timestamp helpers
 *
 * All formatting is done in UTC so exported incidents and audit records
 * compare equal regardless of the host timezone.
 *
 * @date 2025
 */

#include "warden/utils/time_utils.hpp"

#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>

namespace warden {
namespace utils {

namespace {

std::tm ToUtc(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

} // namespace

std::string TimeUtils::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto millis = ToEpochMillis(time);
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    int remainder = static_cast<int>(millis % 1000);
    if (remainder < 0) {
        remainder += 1000;
        seconds -= 1;
    }

    std::tm tm = ToUtc(seconds);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << remainder << 'Z';
    return oss.str();
}

std::string TimeUtils::FormatCompact(const std::chrono::system_clock::time_point& time) {
    std::tm tm = ToUtc(std::chrono::system_clock::to_time_t(time));
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d%H%M%S");
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> TimeUtils::ParseTimestamp(const std::string& text) {
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::string normalized = text;
    if (normalized[10] == ' ') {
        normalized[10] = 'T';
    }

    std::tm tm{};
    std::istringstream iss(normalized.substr(0, 19));
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    long long millis = 0;
    std::size_t pos = 19;
    if (pos < normalized.size() && normalized[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < normalized.size() && std::isdigit(static_cast<unsigned char>(normalized[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (normalized[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    if (pos < normalized.size() && normalized[pos] != 'Z') {
        return std::nullopt;
    }

    std::time_t seconds = timegm(&tm);
    return FromEpochMillis(static_cast<long long>(seconds) * 1000 + millis);
}

std::chrono::system_clock::time_point TimeUtils::FromEpochMillis(long long millis) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

long long TimeUtils::ToEpochMillis(const std::chrono::system_clock::time_point& time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

} // namespace utils
} // namespace warden
