#pragma once

#include <utility>

#include "hasher/CodecHasher.hpp"

namespace hashid {

/**
 * @brief Default strategy: plain codec over the factory defaults
 *
 * Adds no type-specific defaults of its own.
 */
class DefaultHasher : public CodecHasher {
public:
    explicit DefaultHasher(std::shared_ptr<const ICodec> codec) : CodecHasher(std::move(codec)) {}

    const char* name() const override { return "default"; }

    static HasherOptions typeDefaults() { return {}; }
};

}
