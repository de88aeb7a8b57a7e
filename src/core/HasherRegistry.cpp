#include "core/HasherRegistry.hpp"

#include <utility>

#include "core/Constants.hpp"
#include "core/Errors.hpp"
#include "core/HasherFactory.hpp"
#include "hasher/HashidsConverter.hpp"
#include "util/Logger.hpp"

namespace hashid {

namespace {

bool isValidNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-' || c == '.';
}

}

HasherRegistry::HasherRegistry(std::shared_ptr<HasherFactory> factory, EnvResolver resolver)
    : factory_(std::move(factory)),
      resolver_(resolver ? std::move(resolver) : EnvResolver(Env::systemResolver)) {
    if (!factory_) {
        throw ConfigurationValidationError("factory", "Hasher factory must not be null");
    }
    entries[Constants::DEFAULT_HASHER_NAME] = Entry{};
}

void HasherRegistry::registerHasher(const std::string& name, const HasherOptions& config) {
    validate(name, config);
    std::lock_guard<std::mutex> lock(mtx);
    entries[name] = Entry{config, nullptr};
    Logger::instance().debug("Registered hasher: " + name);
}

void HasherRegistry::registerHashers(const std::map<std::string, HasherOptions>& configs) {
    for (const auto& [name, config] : configs) {
        validate(name, config);
    }
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& [name, config] : configs) {
        entries[name] = Entry{config, nullptr};
    }
    Logger::instance().debug("Registered " + std::to_string(configs.size()) + " hashers");
}

std::shared_ptr<HashidsConverter> HasherRegistry::getConverter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = entries.find(name);
    if (it == entries.end()) {
        throw HasherNotFound(name, namesLocked());
    }
    Entry& entry = it->second;
    if (!entry.converter) {
        HasherOptions resolved = resolveEnvironment(name, entry.config);
        entry.converter = factory_->createConverter(HasherType::Default, resolved);
        Logger::instance().debug("Materialized converter for hasher: " + name);
    }
    return entry.converter;
}

bool HasherRegistry::hasHasher(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries.count(name) != 0;
}

std::vector<std::string> HasherRegistry::getHasherNames() const {
    std::lock_guard<std::mutex> lock(mtx);
    return namesLocked();
}

std::optional<HasherOptions> HasherRegistry::getHasherConfiguration(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = entries.find(name);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second.config;
}

EntryState HasherRegistry::state(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = entries.find(name);
    if (it == entries.end()) {
        return EntryState::Unregistered;
    }
    return it->second.converter ? EntryState::Materialized : EntryState::Registered;
}

void HasherRegistry::clearCaches() {
    std::lock_guard<std::mutex> lock(mtx);
    for (auto& kv : entries) {
        kv.second.converter.reset();
    }
}

void HasherRegistry::validate(const std::string& name, const HasherOptions& config) const {
    if (name.empty()) {
        throw ConfigurationValidationError("hasher_name", "Hasher name cannot be empty");
    }
    if (name.size() > Constants::MAX_HASHER_NAME_LENGTH) {
        throw ConfigurationValidationError(
            "hasher_name",
            "Name too long (max " + std::to_string(Constants::MAX_HASHER_NAME_LENGTH) + " characters)");
    }
    for (char c : name) {
        if (!isValidNameChar(c)) {
            throw ConfigurationValidationError(
                "hasher_name",
                "Names can only contain letters, numbers, underscores, hyphens, and dots");
        }
    }
    validateConfig(mergeConfig(config, {}, factory_->defaults()));
}

HasherOptions HasherRegistry::resolveEnvironment(const std::string& name, const HasherOptions& config) const {
    if (!config.salt) {
        return config;
    }
    auto variable = Env::placeholderVariable(*config.salt);
    if (!variable) {
        return config;
    }
    auto value = resolver_(*variable);
    if (!value) {
        throw ConfigurationValidationError(
            "salt", "Environment variable " + *variable + " for hasher " + name + " is not set");
    }
    HasherOptions resolved = config;
    resolved.salt = *value;
    return resolved;
}

std::vector<std::string> HasherRegistry::namesLocked() const {
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& kv : entries) {
        names.push_back(kv.first);
    }
    return names;
}

}
