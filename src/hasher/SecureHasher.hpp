#pragma once

#include <utility>

#include "hasher/CodecHasher.hpp"

namespace hashid {

/**
 * @brief Secure strategy with timestamp entropy
 *
 * Each encode mixes the current unix time (seconds) into the hash as a second
 * number, so the same id encodes differently over time. Decoding keeps the
 * first number and drops the timestamp.
 *
 * Defaults to min length 20 and an alphabet with symbols. An empty salt is
 * replaced by a generated one in HasherFactory before construction.
 */
class SecureHasher : public CodecHasher {
public:
    explicit SecureHasher(std::shared_ptr<const ICodec> codec) : CodecHasher(std::move(codec)) {}

    using CodecHasher::encode;
    std::string encode(uint64_t value) const override;
    const char* name() const override { return "secure"; }

    static HasherOptions typeDefaults();
};

}
