#pragma once

#include <cstddef>

/**
 * @brief Hasher defaults and limits used throughout the codebase
 */
namespace hashid {

namespace Constants {
    // Built-in hasher defaults
    constexpr const char* DEFAULT_SALT = "";
    constexpr int DEFAULT_MIN_LENGTH = 10;
    constexpr const char* DEFAULT_ALPHABET =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ1234567890";

    // Secure hasher: longer hashes, richer alphabet
    constexpr int SECURE_MIN_LENGTH = 20;
    constexpr const char* SECURE_ALPHABET =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ1234567890!@#$%^&*";
    constexpr size_t SECURE_SALT_BYTES = 32;     // 256 bits, hex encoded to 64 chars

    constexpr int CUSTOM_MIN_LENGTH = 15;

    // Validation limits
    constexpr size_t MIN_ALPHABET_UNIQUE = 16;
    constexpr int MAX_MIN_LENGTH = 255;
    constexpr size_t MAX_HASHER_NAME_LENGTH = 50;

    // Instance cache
    constexpr int DEFAULT_MAX_CACHE_SIZE = 10;
    constexpr size_t CACHE_SECRET_BYTES = 32;    // HMAC key for cache key fingerprints

    // Registry
    constexpr const char* DEFAULT_HASHER_NAME = "default";
}
}
