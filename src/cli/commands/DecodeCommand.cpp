#include "cli/commands/DecodeCommand.hpp"

#include <iostream>
#include <variant>

#include "cli/HasherSelection.hpp"
#include "hasher/IHasher.hpp"

namespace hashid {

Expected<void> DecodeCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto selection = selectHasher(ctx, args);
    if (!selection) {
        return selection.error();
    }
    const auto& [hasher, hashes] = selection.value();
    if (hashes.empty()) {
        return Error{ErrorCode::InvalidArgs, std::string("usage: ") + helpSynopsis()};
    }
    for (const auto& hash : hashes) {
        Decoded decoded = hasher->decode(hash);
        if (const auto* number = std::get_if<uint64_t>(&decoded)) {
            std::cout << *number << "\n";
        } else {
            std::cout << std::get<std::string>(decoded) << "\n";
        }
    }
    return {};
}

}
