#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace hashid {

/// Untyped key/value configuration as read from files or passed by callers
using ConfigMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Fully resolved parameters of one codec instantiation
 *
 * Valid only if 0 <= minLength <= 255 and the alphabet holds at least 16 unique
 * characters (no whitespace). The salt may be empty and is never logged.
 */
struct HasherConfig {
    std::string salt;
    int minLength{0};
    std::string alphabet;

    /// Built-in defaults: empty salt, min length 10, alphanumeric alphabet
    static HasherConfig builtinDefaults();

    bool operator==(const HasherConfig& other) const {
        return salt == other.salt && minLength == other.minLength && alphabet == other.alphabet;
    }
    bool operator!=(const HasherConfig& other) const { return !(*this == other); }
};

/**
 * @brief Per-call overrides; unset fields fall back to the next layer
 */
struct HasherOptions {
    std::optional<std::string> salt;
    std::optional<int> minLength;
    std::optional<std::string> alphabet;

    /**
     * @brief Build from a key/value map
     *
     * Keys: "salt", "min_length" (alias "min_hash_length"), "alphabet".
     * @throws ConfigurationValidationError on unknown keys or a min_length
     *         that is not a base-10 integer
     */
    static HasherOptions fromMap(const ConfigMap& values);

    bool operator==(const HasherOptions& other) const {
        return salt == other.salt && minLength == other.minLength && alphabet == other.alphabet;
    }
};

/// Number of distinct characters in `alphabet`
size_t uniqueCharCount(const std::string& alphabet);

/// @throws ConfigurationValidationError if `config` breaks an invariant
void validateConfig(const HasherConfig& config);

/// @throws ConfigurationValidationError if `maxCacheSize` <= 0
void validateMaxCacheSize(int maxCacheSize);

/**
 * @brief Layer overrides over type defaults over base, field by field
 *
 * The result is not validated.
 */
HasherConfig mergeConfig(const HasherOptions& overrides,
                         const HasherOptions& typeDefaults,
                         const HasherConfig& base);

/**
 * @brief Deterministic serialization with lexicographically sorted keys
 *
 * Values are length-delimited, so "alphabet:62:...;min_length:2:10;salt:0:;".
 * Contains the salt: hash it before exposing.
 */
std::string canonicalize(const HasherConfig& config);

}
