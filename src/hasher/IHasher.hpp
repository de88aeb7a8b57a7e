#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace hashid {

/// Result of decode(): the original number, or the input string on passthrough
using Decoded = std::variant<uint64_t, std::string>;

/**
 * @brief Strategy interface for identifier hashers
 *
 * Allows swapping between hasher strategies (default, secure, custom) without
 * changing client code. Implementations are immutable after construction and
 * may be shared between threads.
 *
 * Neither encode nor decode throws on out-of-domain input: non-numeric input
 * to encode and undecodable input to decode are returned unchanged, so valid
 * and forged hashes are indistinguishable by error behavior.
 */
class IHasher {
public:
    virtual ~IHasher() = default;

    /// Encode a number
    virtual std::string encode(uint64_t value) const = 0;

    /// Encode a decimal string; anything non-numeric is returned unchanged
    std::string encode(const std::string& value) const;

    /// Decode a hash; returns the hash itself if it does not decode
    virtual Decoded decode(const std::string& hash) const = 0;

    /// Strategy name (e.g., "default", "secure")
    virtual const char* name() const = 0;

    /// True if `value` is a base-10 unsigned integer that fits in 64 bits
    static bool parseNumeric(const std::string& value, uint64_t& out);
};

}
