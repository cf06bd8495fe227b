#ifndef DOCREDACT_UTIL_HASHING_HPP
#define DOCREDACT_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <vector>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <openssl/rand.h>

/**
 * @file hashing.hpp
 * @brief Digest and randomness helpers backed by OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - SHA-256 digests (lowercase hex) identify original and redacted
 *     artifacts in reports and the audit store.
 *   - randomBytes()/randomHex() come from the OpenSSL CSPRNG. They feed PDF
 *     owner passwords, temp file names and the overwrite pass of secure
 *     deletion.
 *
 * USAGE:
 *   @code
 *   using namespace docredact::util::hashing;
 *   std::string digest = sha256(bytes);
 *   std::string ownerPw = randomHex(16);   // 32 hex characters
 *   @endcode
 */

namespace docredact {
namespace util {
namespace hashing {

namespace detail {

inline std::string toHex(const unsigned char *data, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

} // namespace detail

/**
 * @brief SHA-256 of a memory buffer as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256(const uint8_t *data, size_t len)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int outLen = 0;
    if (EVP_Digest(data, len, hash, &outLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("hashing::sha256: EVP_Digest failed.");
    }
    return detail::toHex(hash, outLen);
}

inline std::string sha256(const std::vector<uint8_t> &input)
{
    return sha256(input.data(), input.size());
}

inline std::string sha256(const std::string &input)
{
    return sha256(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/**
 * @brief SHA-256 of a file, read in chunks.
 * @throw std::runtime_error if the file cannot be opened or OpenSSL fails.
 */
inline std::string sha256File(const std::string &filePath)
{
    std::ifstream ifs(filePath, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("hashing::sha256File: Failed to open file: " + filePath);
    }

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256File: Failed to create EVP_MD_CTX.");
    }

    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256File: EVP_DigestInit_ex failed.");
    }

    char buffer[8192];
    while (ifs.read(buffer, sizeof(buffer)) || ifs.gcount()) {
        if (EVP_DigestUpdate(mdctx, buffer, static_cast<size_t>(ifs.gcount())) != 1) {
            EVP_MD_CTX_free(mdctx);
            throw std::runtime_error("hashing::sha256File: EVP_DigestUpdate failed.");
        }
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(mdctx, hash, &outLen) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256File: EVP_DigestFinal_ex failed.");
    }
    EVP_MD_CTX_free(mdctx);
    return detail::toHex(hash, outLen);
}

/**
 * @brief Fill a buffer with cryptographically secure random bytes.
 * @throw std::runtime_error if the OpenSSL RNG is not seeded.
 */
inline std::vector<uint8_t> randomBytes(size_t count)
{
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("hashing::randomBytes: RAND_bytes failed.");
    }
    return out;
}

/**
 * @brief @p byteCount random bytes as a lowercase hex string (2x chars).
 */
inline std::string randomHex(size_t byteCount)
{
    std::vector<uint8_t> bytes = randomBytes(byteCount);
    return detail::toHex(bytes.data(), bytes.size());
}

} // namespace hashing
} // namespace util
} // namespace docredact

#endif // DOCREDACT_UTIL_HASHING_HPP
