#pragma once

#include <utility>

#include "core/Constants.hpp"
#include "hasher/CodecHasher.hpp"

namespace hashid {

/**
 * @brief Custom strategy: behaves like default, meant for caller overrides
 *
 * Defaults to a minimum length of 15 when the caller does not set one.
 */
class CustomHasher : public CodecHasher {
public:
    explicit CustomHasher(std::shared_ptr<const ICodec> codec) : CodecHasher(std::move(codec)) {}

    const char* name() const override { return "custom"; }

    static HasherOptions typeDefaults() {
        HasherOptions defaults;
        defaults.minLength = Constants::CUSTOM_MIN_LENGTH;
        return defaults;
    }
};

}
