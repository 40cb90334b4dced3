/**
 * @file string_utils.hpp
 * @brief String helpers for audit actions, rule values and identifiers
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace warden {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto channels = StringUtils::Split("email,sms", ',');
 * if (StringUtils::ContainsSecurityKeyword("FAILED_LOGIN")) { ... }
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /// Strip leading and trailing whitespace
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);
    static std::string ToUpper(const std::string& str);

    /**
     * @brief Split on a single delimiter
     *
     * Empty tokens are dropped and each token is trimmed, so
     * `"email, sms,"` yields `{"email", "sms"}`.
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Pattern Detection
     ***************************************************************************/

    /**
     * @brief Check whether an audit action carries security relevance
     *
     * Case-insensitive keyword match (SECURITY, LOGIN, PERMISSION, ACCESS,
     * EXPORT, DOWNLOAD, SESSION, THREAT).
     */
    static bool ContainsSecurityKeyword(const std::string& action);

    /**
     * @brief Turn an identifier like `brute_force_advanced` into `BRUTE FORCE ADVANCED`
     */
    static std::string ToTitle(const std::string& identifier);
};

} // namespace utils
} // namespace warden
