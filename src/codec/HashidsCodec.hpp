#pragma once

#include <memory>

#include <hashids.h>

#include "codec/ICodec.hpp"

namespace hashid {

/**
 * @brief ICodec backed by the hashidsxx library
 *
 * decode() only accepts hashes that re-encode to the same string, so input
 * produced under another salt, alphabet or min length yields an empty result.
 */
class HashidsCodec : public ICodec {
public:
    explicit HashidsCodec(const HasherConfig& config);

    std::string encode(const std::vector<uint64_t>& numbers) const override;
    std::vector<uint64_t> decode(const std::string& hash) const override;

    /// CodecProvider entry point
    static std::shared_ptr<const ICodec> create(const HasherConfig& config);

private:
    hashidsxx::Hashids hashids_;
};

}
