/**
 * @file hash_utils.hpp
 * @brief Digest helpers used to derive stable identifiers
 *
 * Correlation-derived threats need an id that is identical every time the
 * same group of events is detected, so incident creation stays idempotent
 * across overlapping correlation windows. The id is a truncated SHA-256 of
 * the rule id, correlation key and first event id.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace warden {
namespace utils {

/**
 * @class HashUtils
 * @brief Static digest helpers (OpenSSL EVP)
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a string, lowercase hex
     * @throws std::runtime_error if the digest cannot be computed
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief First @p hex_chars characters of ComputeSHA256(@p data)
     */
    static std::string Fingerprint(const std::string& data, std::size_t hex_chars = 16);

    static std::string BytesToHex(const uint8_t* data, std::size_t size);
};

} // namespace utils
} // namespace warden
