#include "core/MultiHasherConverter.hpp"

#include <utility>

#include "core/HasherRegistry.hpp"
#include "hasher/HashidsConverter.hpp"

namespace hashid {

MultiHasherConverter::MultiHasherConverter(std::shared_ptr<HasherRegistry> registry, std::string hasherName)
    : registry_(std::move(registry)), hasherName_(std::move(hasherName)) {}

MultiHasherConverter MultiHasherConverter::withHasher(const std::string& hasherName) const {
    MultiHasherConverter copy(*this);
    copy.hasherName_ = hasherName;
    return copy;
}

std::string MultiHasherConverter::encode(uint64_t value) const {
    return registry_->getConverter(hasherName_)->encode(value);
}

Decoded MultiHasherConverter::decode(const std::string& hash) const {
    return registry_->getConverter(hasherName_)->decode(hash);
}

}
