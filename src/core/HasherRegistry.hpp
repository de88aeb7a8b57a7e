#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/EnvResolver.hpp"
#include "core/HasherConfig.hpp"

namespace hashid {

class HasherFactory;
class HashidsConverter;

/// Lifecycle of a named registration
enum class EntryState { Unregistered, Registered, Materialized };

/**
 * @brief Named hasher configurations with lazily built converters
 *
 * Maps stable names ("default", "secure-api", ...) to hasher options. The first
 * getConverter() for a name builds a converter through
 * HasherFactory::createConverter() and memoizes it; re-registering the name
 * drops the memoized converter (Materialized -> Registered).
 *
 * A salt of the form "%env(NAME)%" is kept unresolved at registration and
 * looked up through the EnvResolver when the converter is first built.
 *
 * "default" is always registered, using the factory defaults unless
 * overridden. Names are 1-50 characters of [A-Za-z0-9_.-].
 *
 * Thread-safe: one mutex guards names and memoized converters, and the
 * converter for a name is built under it.
 */
class HasherRegistry {
public:
    /**
     * @param factory Factory used to build converters
     * @param resolver Environment lookup for "%env()%" salts (process env if null)
     * @throws ConfigurationValidationError if `factory` is null
     */
    explicit HasherRegistry(std::shared_ptr<HasherFactory> factory, EnvResolver resolver = nullptr);

    /**
     * @brief Register or replace a named configuration
     * @throws ConfigurationValidationError for an invalid name or config
     */
    void registerHasher(const std::string& name, const HasherOptions& config);

    /**
     * @brief Register several configurations; all or nothing
     * @throws ConfigurationValidationError if any entry is invalid (none committed)
     */
    void registerHashers(const std::map<std::string, HasherOptions>& configs);

    /**
     * @brief Memoized converter for `name`
     * @throws HasherNotFound if `name` was never registered
     * @throws ConfigurationValidationError if an "%env()%" salt is unset
     */
    std::shared_ptr<HashidsConverter> getConverter(const std::string& name = "default");

    bool hasHasher(const std::string& name) const;

    /// Registered names, sorted
    std::vector<std::string> getHasherNames() const;

    /// Options as registered (salt placeholders unresolved)
    std::optional<HasherOptions> getHasherConfiguration(const std::string& name) const;

    EntryState state(const std::string& name) const;

    /// Drop every memoized converter
    void clearCaches();

    const std::shared_ptr<HasherFactory>& factory() const { return factory_; }

private:
    struct Entry {
        HasherOptions config;
        std::shared_ptr<HashidsConverter> converter;   // null until materialized
    };

    void validate(const std::string& name, const HasherOptions& config) const;
    HasherOptions resolveEnvironment(const std::string& name, const HasherOptions& config) const;
    std::vector<std::string> namesLocked() const;

    std::shared_ptr<HasherFactory> factory_;
    EnvResolver resolver_;
    mutable std::mutex mtx;
    std::map<std::string, Entry> entries;
};

}
