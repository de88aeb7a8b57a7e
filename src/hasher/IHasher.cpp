#include "hasher/IHasher.hpp"

#include <limits>

namespace hashid {

std::string IHasher::encode(const std::string& value) const {
    uint64_t number = 0;
    if (!parseNumeric(value, number)) {
        return value;
    }
    return encode(number);
}

bool IHasher::parseNumeric(const std::string& value, uint64_t& out) {
    if (value.empty()) {
        return false;
    }
    uint64_t number = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (number > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return false;
        }
        number = number * 10 + digit;
    }
    out = number;
    return true;
}

}
