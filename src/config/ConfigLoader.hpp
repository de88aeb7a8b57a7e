#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include "codec/ICodec.hpp"
#include "core/Constants.hpp"
#include "core/EnvResolver.hpp"
#include "core/HasherConfig.hpp"
#include "util/Expected.hpp"

namespace hashid {

class HasherRegistry;

/// Parsed configuration file
struct HashidConfig {
    HasherConfig factoryDefaults = HasherConfig::builtinDefaults();
    int maxCacheSize = Constants::DEFAULT_MAX_CACHE_SIZE;
    std::map<std::string, HasherOptions> hashers;
};

/**
 * @brief Loader for git-config style hasher configuration files
 *
 * Format:
 *   # comment
 *   [factory]
 *   salt = ...
 *   min_length = 10
 *   alphabet = ...
 *   max_cache_size = 10
 *
 *   [hasher "secure-api"]
 *   salt = %env(API_SALT)%
 *   min_length = 20
 *
 * Values may be wrapped in double quotes. Lines starting with '#' or ';' are
 * comments. Errors carry the 1-based line number.
 */
namespace ConfigLoader {

/// Read and parse a file; IoError if unreadable
Expected<HashidConfig> load(const std::filesystem::path& path);

/// Parse configuration text; InvalidArgs on malformed input
Expected<HashidConfig> parse(const std::string& text);

/**
 * @brief Build a factory over `codecs` and a registry holding every configured hasher
 *
 * Hashers are registered in one all-or-nothing batch. ConfigurationError if
 * the factory defaults or any hasher is invalid.
 */
Expected<std::shared_ptr<HasherRegistry>> apply(const HashidConfig& config, CodecProvider codecs,
                                                EnvResolver resolver = nullptr);

}

}
