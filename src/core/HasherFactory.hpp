#pragma once

#include <memory>
#include <string>
#include <vector>

#include "codec/ICodec.hpp"
#include "core/Constants.hpp"
#include "core/HasherConfig.hpp"
#include "core/HasherType.hpp"
#include "core/InstanceCache.hpp"

namespace hashid {

class IHasher;
class HashidsConverter;

/**
 * @brief Factory for validated, cached hasher instances
 *
 * Every request goes through the same pipeline:
 *   1. resolve the type name against the closed HasherType set
 *   2. merge overrides > type defaults > factory defaults, field by field
 *   3. validate the effective config
 *   4. for the secure type, replace an empty salt with 256 fresh random bits
 *   5. look up "<type>:<hmac(canonical config)>" in the instance cache
 *
 * create() returns the cached instance for equivalent configs;
 * createConverter() always builds a new converter and bypasses the cache.
 *
 * Generated secure salts are never stored outside the hasher built with them,
 * so two create("secure") calls with an empty salt give two different hashers.
 *
 * Codecs come from the injected CodecProvider, called once per new instance.
 *
 * Thread-safe: all mutable state lives in the InstanceCache.
 */
class HasherFactory {
public:
    /**
     * @throws ConfigurationValidationError if the codec provider is empty,
     *         minLength is outside [0, 255], the alphabet has fewer than 16
     *         unique characters, or maxCacheSize <= 0
     */
    explicit HasherFactory(CodecProvider codecs,
                           std::string salt = Constants::DEFAULT_SALT,
                           int minLength = Constants::DEFAULT_MIN_LENGTH,
                           std::string alphabet = Constants::DEFAULT_ALPHABET,
                           int maxCacheSize = Constants::DEFAULT_MAX_CACHE_SIZE);

    /**
     * @brief Use an externally owned cache (shared between factories or tests)
     * @throws ConfigurationValidationError if defaults are invalid, or the
     *         provider or cache is null
     */
    HasherFactory(CodecProvider codecs, const HasherConfig& defaults, std::shared_ptr<InstanceCache> cache);

    /**
     * @brief Validated hasher, cached by canonical configuration
     * @throws UnknownHasherType, ConfigurationValidationError
     */
    std::shared_ptr<IHasher> create(const std::string& type, const HasherOptions& overrides = {});
    std::shared_ptr<IHasher> create(HasherType type, const HasherOptions& overrides = {});

    /**
     * @brief Fresh converter through the same validation pipeline, uncached
     * @throws UnknownHasherType, ConfigurationValidationError
     */
    std::shared_ptr<HashidsConverter> createConverter(const std::string& type, const HasherOptions& overrides = {});
    std::shared_ptr<HashidsConverter> createConverter(HasherType type, const HasherOptions& overrides = {});

    /**
     * @brief Populate the cache as create() would and return the cache key
     * @throws UnknownHasherType, ConfigurationValidationError
     */
    std::string preloadConfiguration(const std::string& type, const HasherOptions& overrides = {});

    /// "default", "secure", "custom"
    std::vector<std::string> getAvailableTypes() const;

    CacheStatistics getCacheStatistics() const;
    void clearInstanceCache();
    void resetCacheStatistics();

    const HasherConfig& defaults() const { return defaults_; }
    const std::shared_ptr<InstanceCache>& cache() const { return cache_; }

    /**
     * @brief Effective config for a request (steps 2-4 of the pipeline)
     * @throws ConfigurationValidationError
     */
    HasherConfig resolveConfig(HasherType type, const HasherOptions& overrides) const;

    /// Type-specific defaults layered between overrides and factory defaults
    static HasherOptions typeDefaults(HasherType type);

    /// "<type>:<hex HMAC of canonicalize(config) under the cache secret>"
    std::string cacheKey(HasherType type, const HasherConfig& config) const;

private:
    std::shared_ptr<IHasher> createKeyed(HasherType type, const HasherOptions& overrides, std::string& key);
    std::shared_ptr<IHasher> instantiate(HasherType type, const HasherConfig& config) const;
    std::shared_ptr<const ICodec> codecFor(const HasherConfig& config) const;

    CodecProvider codecs_;
    HasherConfig defaults_;
    std::shared_ptr<InstanceCache> cache_;
};

}
