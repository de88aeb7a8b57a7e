#pragma once

#include "cli/ICommand.hpp"

namespace hashid {

class TypesCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "types"; }
    const char* description() const override { return "List available hasher types"; }
    const char* helpNameLine() const override { return "types -  List hasher types"; }
    const char* helpSynopsis() const override { return "hashid types"; }
    const char* helpDescription() const override { return "Print the hasher types accepted by --type, one per line."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
