/**
 * @file hash_utils.cpp
 * @brief SHA-256 digests via OpenSSL EVP
 *
 * @date 2025
 */

#include "warden/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace warden {
namespace utils {

std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), hash, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return BytesToHex(hash, length);
}

std::string HashUtils::Fingerprint(const std::string& data, std::size_t hex_chars) {
    return ComputeSHA256(data).substr(0, hex_chars);
}

std::string HashUtils::BytesToHex(const uint8_t* data, std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace warden
