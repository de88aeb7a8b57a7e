#include "core/HasherFactory.hpp"

#include <stdexcept>
#include <utility>

#include "core/Errors.hpp"
#include "hasher/CustomHasher.hpp"
#include "hasher/DefaultHasher.hpp"
#include "hasher/HashidsConverter.hpp"
#include "hasher/SecureHasher.hpp"
#include "util/Crypto.hpp"
#include "util/Logger.hpp"

namespace hashid {

namespace {

CodecProvider checkedProvider(CodecProvider codecs) {
    if (!codecs) {
        throw ConfigurationValidationError("codec", "Codec provider must not be empty");
    }
    return codecs;
}

}

HasherFactory::HasherFactory(CodecProvider codecs, std::string salt, int minLength, std::string alphabet,
                             int maxCacheSize)
    : codecs_(checkedProvider(std::move(codecs))), defaults_{std::move(salt), minLength, std::move(alphabet)} {
    validateConfig(defaults_);
    cache_ = std::make_shared<InstanceCache>(maxCacheSize);
}

HasherFactory::HasherFactory(CodecProvider codecs, const HasherConfig& defaults, std::shared_ptr<InstanceCache> cache)
    : codecs_(checkedProvider(std::move(codecs))), defaults_(defaults), cache_(std::move(cache)) {
    validateConfig(defaults_);
    if (!cache_) {
        throw ConfigurationValidationError("cache", "Instance cache must not be null");
    }
}

std::shared_ptr<IHasher> HasherFactory::create(const std::string& type, const HasherOptions& overrides) {
    return create(parseHasherType(type), overrides);
}

std::shared_ptr<IHasher> HasherFactory::create(HasherType type, const HasherOptions& overrides) {
    std::string key;
    return createKeyed(type, overrides, key);
}

std::shared_ptr<HashidsConverter> HasherFactory::createConverter(const std::string& type, const HasherOptions& overrides) {
    return createConverter(parseHasherType(type), overrides);
}

std::shared_ptr<HashidsConverter> HasherFactory::createConverter(HasherType type, const HasherOptions& overrides) {
    HasherConfig config = resolveConfig(type, overrides);
    return std::make_shared<HashidsConverter>(codecFor(config));
}

std::string HasherFactory::preloadConfiguration(const std::string& type, const HasherOptions& overrides) {
    std::string key;
    createKeyed(parseHasherType(type), overrides, key);
    return key;
}

std::vector<std::string> HasherFactory::getAvailableTypes() const {
    return hasherTypeNames();
}

CacheStatistics HasherFactory::getCacheStatistics() const {
    return cache_->statistics();
}

void HasherFactory::clearInstanceCache() {
    cache_->clear();
}

void HasherFactory::resetCacheStatistics() {
    cache_->resetStatistics();
}

HasherConfig HasherFactory::resolveConfig(HasherType type, const HasherOptions& overrides) const {
    HasherConfig config = mergeConfig(overrides, typeDefaults(type), defaults_);
    validateConfig(config);
    if (type == HasherType::Secure && config.salt.empty()) {
        config.salt = Crypto::randomHex(Constants::SECURE_SALT_BYTES);
        Logger::instance().debug("Generated secure salt for secure hasher");
    }
    return config;
}

HasherOptions HasherFactory::typeDefaults(HasherType type) {
    switch (type) {
        case HasherType::Default: return DefaultHasher::typeDefaults();
        case HasherType::Secure: return SecureHasher::typeDefaults();
        case HasherType::Custom: return CustomHasher::typeDefaults();
    }
    return {};
}

std::string HasherFactory::cacheKey(HasherType type, const HasherConfig& config) const {
    return std::string(toString(type)) + ":" + cache_->fingerprint(canonicalize(config));
}

std::shared_ptr<IHasher> HasherFactory::createKeyed(HasherType type, const HasherOptions& overrides, std::string& key) {
    HasherConfig config = resolveConfig(type, overrides);
    key = cacheKey(type, config);
    return cache_->getOrCreate(key, [this, type, &config] { return instantiate(type, config); });
}

std::shared_ptr<IHasher> HasherFactory::instantiate(HasherType type, const HasherConfig& config) const {
    switch (type) {
        case HasherType::Default: return std::make_shared<DefaultHasher>(codecFor(config));
        case HasherType::Secure: return std::make_shared<SecureHasher>(codecFor(config));
        case HasherType::Custom: return std::make_shared<CustomHasher>(codecFor(config));
    }
    throw UnknownHasherType(hasherTypeNames());
}

std::shared_ptr<const ICodec> HasherFactory::codecFor(const HasherConfig& config) const {
    auto codec = codecs_(config);
    if (!codec) {
        throw std::runtime_error("Codec provider returned no codec");
    }
    return codec;
}

}
