#pragma once

#include <utility>
#include <vector>

#include "hasher/CodecHasher.hpp"

namespace hashid {

/**
 * @brief Stateless codec-backed converter handed out by the registry
 *
 * Same passthrough contract as the strategies, plus multi-number hashes.
 * Never participates in the factory's instance cache.
 */
class HashidsConverter : public CodecHasher {
public:
    explicit HashidsConverter(std::shared_ptr<const ICodec> codec) : CodecHasher(std::move(codec)) {}

    const char* name() const override { return "hashids"; }

    /// Encode several numbers into one hash
    std::string encodeMany(const std::vector<uint64_t>& values) const;

    /// Decode every number in a hash; empty if it does not decode
    std::vector<uint64_t> decodeAll(const std::string& hash) const;
};

}
