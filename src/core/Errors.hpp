#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace hashid {

/**
 * @brief Base of all hasher factory / registry errors
 *
 * Carries the ErrorCode so callers that report through Expected<T>
 * (config loader, CLI) can convert without string matching.
 */
class HashIdException : public std::runtime_error {
public:
    HashIdException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

    /// Convert to the Expected<T> error value
    Error toError() const { return Error{code_, what()}; }

private:
    ErrorCode code_;
};

/// Invalid min_length, alphabet, cache size, hasher name or override map
class ConfigurationValidationError : public HashIdException {
public:
    ConfigurationValidationError(const std::string& field, const std::string& reason);

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/// Requested hasher type is outside the closed set; never echoes the input
class UnknownHasherType : public HashIdException {
public:
    explicit UnknownHasherType(const std::vector<std::string>& allowed);
};

/// Registry lookup for a name that was never registered
class HasherNotFound : public HashIdException {
public:
    HasherNotFound(const std::string& name, const std::vector<std::string>& available);

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

}
