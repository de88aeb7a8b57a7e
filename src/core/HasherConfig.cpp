#include "core/HasherConfig.hpp"

#include <cctype>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>

#include "core/Constants.hpp"
#include "core/Errors.hpp"

namespace hashid {

HasherConfig HasherConfig::builtinDefaults() {
    return HasherConfig{Constants::DEFAULT_SALT, Constants::DEFAULT_MIN_LENGTH, Constants::DEFAULT_ALPHABET};
}

namespace {

int parseMinLength(const std::string& key, const std::string& text) {
    size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(text, &consumed, 10);
    } catch (const std::exception&) {
        throw ConfigurationValidationError(key, "Must be an integer");
    }
    if (consumed != text.size()) {
        throw ConfigurationValidationError(key, "Must be an integer");
    }
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigurationValidationError(key, "Out of range");
    }
    return static_cast<int>(value);
}

}

HasherOptions HasherOptions::fromMap(const ConfigMap& values) {
    HasherOptions options;
    for (const auto& [key, value] : values) {
        if (key == "salt") {
            options.salt = value;
        } else if (key == "min_length" || key == "min_hash_length") {
            options.minLength = parseMinLength(key, value);
        } else if (key == "alphabet") {
            options.alphabet = value;
        } else {
            throw ConfigurationValidationError(key, "Unknown configuration key");
        }
    }
    return options;
}

size_t uniqueCharCount(const std::string& alphabet) {
    std::set<char> seen(alphabet.begin(), alphabet.end());
    return seen.size();
}

void validateConfig(const HasherConfig& config) {
    if (config.minLength < 0) {
        throw ConfigurationValidationError("min_length", "Must be non-negative integer");
    }
    if (config.minLength > Constants::MAX_MIN_LENGTH) {
        throw ConfigurationValidationError(
            "min_length", "Must not exceed " + std::to_string(Constants::MAX_MIN_LENGTH));
    }
    size_t unique = uniqueCharCount(config.alphabet);
    if (unique < Constants::MIN_ALPHABET_UNIQUE) {
        throw ConfigurationValidationError(
            "alphabet",
            "Must contain at least " + std::to_string(Constants::MIN_ALPHABET_UNIQUE) +
                " unique characters, got " + std::to_string(unique));
    }
    for (char c : config.alphabet) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            throw ConfigurationValidationError("alphabet", "Cannot contain whitespace");
        }
    }
}

void validateMaxCacheSize(int maxCacheSize) {
    if (maxCacheSize <= 0) {
        throw ConfigurationValidationError("max_cache_size", "Must be a positive integer");
    }
}

HasherConfig mergeConfig(const HasherOptions& overrides,
                         const HasherOptions& typeDefaults,
                         const HasherConfig& base) {
    HasherConfig out = base;
    if (overrides.salt) out.salt = *overrides.salt;
    else if (typeDefaults.salt) out.salt = *typeDefaults.salt;

    if (overrides.minLength) out.minLength = *overrides.minLength;
    else if (typeDefaults.minLength) out.minLength = *typeDefaults.minLength;

    if (overrides.alphabet) out.alphabet = *overrides.alphabet;
    else if (typeDefaults.alphabet) out.alphabet = *typeDefaults.alphabet;
    return out;
}

std::string canonicalize(const HasherConfig& config) {
    // std::map keeps keys sorted
    std::map<std::string, std::string> fields{
        {"salt", config.salt},
        {"min_length", std::to_string(config.minLength)},
        {"alphabet", config.alphabet},
    };
    std::string out;
    for (const auto& [key, value] : fields) {
        out += key;
        out += ':';
        out += std::to_string(value.size());
        out += ':';
        out += value;
        out += ';';
    }
    return out;
}

}
