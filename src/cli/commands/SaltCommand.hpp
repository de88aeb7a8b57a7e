#pragma once

#include "cli/ICommand.hpp"

namespace hashid {

class SaltCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "salt"; }
    const char* description() const override { return "Generate a secure salt"; }
    const char* helpNameLine() const override { return "salt -  Generate a random salt"; }
    const char* helpSynopsis() const override { return "hashid salt"; }
    const char* helpDescription() const override { return "Print a new 256-bit random salt, hex encoded, suitable for a hasher configuration."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
