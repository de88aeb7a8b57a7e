#include "hasher/SecureHasher.hpp"

#include <chrono>
#include <vector>

#include "core/Constants.hpp"

namespace hashid {

std::string SecureHasher::encode(uint64_t value) const {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto timestamp = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    return codec().encode(std::vector<uint64_t>{value, timestamp});
}

HasherOptions SecureHasher::typeDefaults() {
    HasherOptions defaults;
    defaults.minLength = Constants::SECURE_MIN_LENGTH;
    defaults.alphabet = std::string(Constants::SECURE_ALPHABET);
    return defaults;
}

}
