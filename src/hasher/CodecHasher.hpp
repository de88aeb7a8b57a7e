#pragma once

#include <memory>

#include "codec/ICodec.hpp"
#include "core/HasherConfig.hpp"
#include "hasher/IHasher.hpp"

namespace hashid {

/**
 * @brief IHasher backed by a single codec instance
 *
 * Encodes one number per hash and decodes to the first number of the hash.
 * The codec must have been built from a validated config.
 */
class CodecHasher : public IHasher {
public:
    explicit CodecHasher(std::shared_ptr<const ICodec> codec);

    using IHasher::encode;
    std::string encode(uint64_t value) const override;
    Decoded decode(const std::string& hash) const override;

protected:
    const ICodec& codec() const { return *codec_; }

private:
    std::shared_ptr<const ICodec> codec_;
};

}
