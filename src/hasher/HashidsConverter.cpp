#include "hasher/HashidsConverter.hpp"

namespace hashid {

std::string HashidsConverter::encodeMany(const std::vector<uint64_t>& values) const {
    return codec().encode(values);
}

std::vector<uint64_t> HashidsConverter::decodeAll(const std::string& hash) const {
    return codec().decode(hash);
}

}
