#include "cli/commands/SaltCommand.hpp"

#include <iostream>

#include "core/Constants.hpp"
#include "util/Crypto.hpp"

namespace hashid {

Expected<void> SaltCommand::execute(const AppContext&, const std::vector<std::string>&) {
    std::cout << Crypto::randomHex(Constants::SECURE_SALT_BYTES) << "\n";
    return {};
}

}
