#pragma once

#include <functional>
#include <optional>
#include <string>

namespace hashid {

/// Looks up an environment variable by name; nullopt if unset
using EnvResolver = std::function<std::optional<std::string>(const std::string&)>;

namespace Env {

/**
 * @brief Extract the variable name from a "%env(NAME)%" placeholder
 *
 * A typed form "%env(string:NAME)%" yields "NAME". Returns nullopt when
 * `value` is not a placeholder.
 */
std::optional<std::string> placeholderVariable(const std::string& value);

/// Resolver backed by the process environment (std::getenv)
std::optional<std::string> systemResolver(const std::string& name);

}

}
