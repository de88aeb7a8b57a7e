#include "core/EnvResolver.hpp"

#include <cstdlib>
#include <regex>

namespace hashid {
namespace Env {

std::optional<std::string> placeholderVariable(const std::string& value) {
    static const std::regex pattern("^%env\\(([^)]+)\\)%$");
    std::smatch match;
    if (!std::regex_match(value, match, pattern)) {
        return std::nullopt;
    }
    std::string name = match[1].str();
    auto colon = name.find(':');
    if (colon != std::string::npos) {
        name = name.substr(colon + 1);
    }
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

std::optional<std::string> systemResolver(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

}
}
