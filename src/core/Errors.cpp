#include "core/Errors.hpp"

namespace hashid {

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += items[i];
    }
    return out;
}

}

ConfigurationValidationError::ConfigurationValidationError(const std::string& field, const std::string& reason)
    : HashIdException(ErrorCode::ConfigurationError,
                      "Invalid hasher configuration (" + field + "): " + reason),
      field_(field) {}

UnknownHasherType::UnknownHasherType(const std::vector<std::string>& allowed)
    : HashIdException(ErrorCode::UnknownHasherType,
                      "Unknown hasher type. Available types: " + join(allowed)) {}

HasherNotFound::HasherNotFound(const std::string& name, const std::vector<std::string>& available)
    : HashIdException(ErrorCode::HasherNotFound,
                      available.empty()
                          ? "Hasher \"" + name + "\" not found. No hashers are configured."
                          : "Hasher \"" + name + "\" not found. Available hashers: " + join(available)),
      name_(name) {}

}
