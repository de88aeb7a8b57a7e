#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace hashid {

/// Runs a command and logs its failure; errors are returned, not thrown
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
