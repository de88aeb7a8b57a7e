#include "cli/commands/HashersCommand.hpp"

#include <iostream>

#include "core/HasherRegistry.hpp"

namespace hashid {

Expected<void> HashersCommand::execute(const AppContext& ctx, const std::vector<std::string>&) {
    if (!ctx.registry) {
        return Error{ErrorCode::InternalError, "No hasher registry configured"};
    }
    for (const auto& name : ctx.registry->getHasherNames()) {
        std::cout << name << "\n";
    }
    return {};
}

}
