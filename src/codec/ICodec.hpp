#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hashid {

struct HasherConfig;

/**
 * @brief Reversible integer sequence <-> string transform
 *
 * One instance is bound to one (salt, min length, alphabet) configuration.
 * encode() and decode() are const and safe to call concurrently.
 *
 * decode() returns an empty vector for any string that is not a hash this
 * codec would produce.
 */
class ICodec {
public:
    virtual ~ICodec() = default;

    virtual std::string encode(const std::vector<uint64_t>& numbers) const = 0;
    virtual std::vector<uint64_t> decode(const std::string& hash) const = 0;
};

/// Builds a codec for an already validated configuration
using CodecProvider = std::function<std::shared_ptr<const ICodec>(const HasherConfig&)>;

}
