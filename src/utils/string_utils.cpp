/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "warden/utils/string_utils.hpp"

#include <sstream>
#include <algorithm>
#include <cctype>

namespace warden {
namespace utils {

// ============================================================================
// STRING MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string StringUtils::ToUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        token = Trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// PATTERN DETECTION
// ============================================================================

bool StringUtils::ContainsSecurityKeyword(const std::string& action) {
    static const std::vector<std::string> keywords = {
        "SECURITY", "LOGIN", "PERMISSION", "ACCESS",
        "EXPORT", "DOWNLOAD", "SESSION", "THREAT"
    };

    std::string upper = ToUpper(action);

    for (const auto& keyword : keywords) {
        if (Contains(upper, keyword)) {
            return true;
        }
    }

    return false;
}

std::string StringUtils::ToTitle(const std::string& identifier) {
    std::string title = ToUpper(identifier);
    std::replace(title.begin(), title.end(), '_', ' ');
    return title;
}

} // namespace utils
} // namespace warden
