#include "core/HasherType.hpp"

#include <array>

#include "core/Errors.hpp"

namespace hashid {

namespace {
constexpr std::array<HasherType, 3> ALL_TYPES = {
    HasherType::Default, HasherType::Secure, HasherType::Custom
};
}

const char* toString(HasherType type) {
    switch (type) {
        case HasherType::Default: return "default";
        case HasherType::Secure: return "secure";
        case HasherType::Custom: return "custom";
    }
    return "default";
}

HasherType parseHasherType(const std::string& name) {
    for (HasherType type : ALL_TYPES) {
        if (name == toString(type)) {
            return type;
        }
    }
    throw UnknownHasherType(hasherTypeNames());
}

std::vector<std::string> hasherTypeNames() {
    std::vector<std::string> names;
    names.reserve(ALL_TYPES.size());
    for (HasherType type : ALL_TYPES) {
        names.emplace_back(toString(type));
    }
    return names;
}

}
