#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hashid {

/**
 * @brief OpenSSL-backed primitives used by the factory
 *
 * randomBytes() draws from the OpenSSL CSPRNG (seeded by the OS) and is used
 * for secure salt generation and cache secrets. hmacSha256Hex() fingerprints
 * canonical configuration strings under such a secret, so cache keys carry
 * neither the salt nor an offline-checkable digest of it.
 */
namespace Crypto {

/// Fill a buffer of `count` bytes from the CSPRNG; throws std::runtime_error on failure
std::vector<uint8_t> randomBytes(size_t count);

/// `count` random bytes, lowercase hex encoded (2 * count chars)
std::string randomHex(size_t count);

/// HMAC-SHA-256 of `data` under `key` as lowercase hex (64 chars)
std::string hmacSha256Hex(const std::vector<uint8_t>& key, const std::string& data);

/// Convert binary data to lowercase hex string
std::string toHex(const std::vector<uint8_t>& bytes);

}

}
