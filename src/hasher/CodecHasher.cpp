#include "hasher/CodecHasher.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace hashid {

CodecHasher::CodecHasher(std::shared_ptr<const ICodec> codec) : codec_(std::move(codec)) {
    if (!codec_) {
        throw std::invalid_argument("CodecHasher requires a codec");
    }
}

std::string CodecHasher::encode(uint64_t value) const {
    return codec_->encode(std::vector<uint64_t>{value});
}

Decoded CodecHasher::decode(const std::string& hash) const {
    auto numbers = codec_->decode(hash);
    if (numbers.empty()) {
        return hash;
    }
    return numbers.front();
}

}
