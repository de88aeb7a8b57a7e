#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace hashid {

class IHasher;

/// Hasher chosen by --hasher/--type plus the remaining positional arguments
struct HasherSelection {
    std::shared_ptr<IHasher> hasher;
    std::vector<std::string> operands;
};

/**
 * @brief Parse "--hasher <name>" or "--type <type>" out of `args`
 *
 * Without either option the registry's "default" converter is used.
 * --type goes through HasherFactory::create() with no overrides.
 */
Expected<HasherSelection> selectHasher(const AppContext& ctx, const std::vector<std::string>& args);

}
