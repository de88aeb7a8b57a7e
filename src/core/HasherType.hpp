#pragma once

#include <string>
#include <vector>

namespace hashid {

/// Closed set of hasher strategies
enum class HasherType { Default, Secure, Custom };

/// "default", "secure", "custom"
const char* toString(HasherType type);

/**
 * @brief Resolve a type name against the closed set
 * @throws UnknownHasherType for anything but an exact, case-sensitive match
 */
HasherType parseHasherType(const std::string& name);

/// All type names in declaration order
std::vector<std::string> hasherTypeNames();

}
