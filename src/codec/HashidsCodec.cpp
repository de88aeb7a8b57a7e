#include "codec/HashidsCodec.hpp"

#include "core/HasherConfig.hpp"

namespace hashid {

HashidsCodec::HashidsCodec(const HasherConfig& config)
    : hashids_(config.salt, static_cast<unsigned int>(config.minLength), config.alphabet) {}

std::string HashidsCodec::encode(const std::vector<uint64_t>& numbers) const {
    if (numbers.empty()) {
        return {};
    }
    return hashids_.encode(numbers.begin(), numbers.end());
}

std::vector<uint64_t> HashidsCodec::decode(const std::string& hash) const {
    if (hash.empty()) {
        return {};
    }
    std::vector<uint64_t> numbers = hashids_.decode(hash);
    if (numbers.empty() || encode(numbers) != hash) {
        return {};
    }
    return numbers;
}

std::shared_ptr<const ICodec> HashidsCodec::create(const HasherConfig& config) {
    return std::make_shared<HashidsCodec>(config);
}

}
