#pragma once

#include <memory>
#include <string>

#include "hasher/IHasher.hpp"

namespace hashid {

class HasherRegistry;

/**
 * @brief Converter bound to a registry name
 *
 * Looks the name up on every call, so re-registrations take effect
 * immediately. withHasher() returns a copy bound to another name.
 *
 * encode/decode throw HasherNotFound if the bound name is not registered.
 */
class MultiHasherConverter : public IHasher {
public:
    explicit MultiHasherConverter(std::shared_ptr<HasherRegistry> registry, std::string hasherName = "default");

    MultiHasherConverter withHasher(const std::string& hasherName) const;
    const std::string& currentHasher() const { return hasherName_; }

    using IHasher::encode;
    std::string encode(uint64_t value) const override;
    Decoded decode(const std::string& hash) const override;
    const char* name() const override { return "multi"; }

private:
    std::shared_ptr<HasherRegistry> registry_;
    std::string hasherName_;
};

}
