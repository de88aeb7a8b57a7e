#pragma once

#include "cli/ICommand.hpp"

namespace hashid {

class HashersCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "hashers"; }
    const char* description() const override { return "List registered hashers"; }
    const char* helpNameLine() const override { return "hashers -  List named hashers"; }
    const char* helpSynopsis() const override { return "hashid hashers"; }
    const char* helpDescription() const override { return "Print the names of all registered hashers, one per line. \"default\" is always present."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
