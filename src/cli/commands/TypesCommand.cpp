#include "cli/commands/TypesCommand.hpp"

#include <iostream>

#include "core/HasherType.hpp"

namespace hashid {

Expected<void> TypesCommand::execute(const AppContext&, const std::vector<std::string>&) {
    for (const auto& type : hasherTypeNames()) {
        std::cout << type << "\n";
    }
    return {};
}

}
