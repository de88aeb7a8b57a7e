#include "cli/commands/EncodeCommand.hpp"

#include <iostream>

#include "cli/HasherSelection.hpp"
#include "hasher/IHasher.hpp"

namespace hashid {

Expected<void> EncodeCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto selection = selectHasher(ctx, args);
    if (!selection) {
        return selection.error();
    }
    const auto& [hasher, values] = selection.value();
    if (values.empty()) {
        return Error{ErrorCode::InvalidArgs, std::string("usage: ") + helpSynopsis()};
    }
    for (const auto& value : values) {
        std::cout << hasher->encode(value) << "\n";
    }
    return {};
}

}
