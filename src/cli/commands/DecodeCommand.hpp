#pragma once

#include "cli/ICommand.hpp"

namespace hashid {

class DecodeCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "decode"; }
    const char* description() const override { return "Decode hashes back to identifiers"; }
    const char* helpNameLine() const override { return "decode -  Decode hashes into identifiers"; }
    const char* helpSynopsis() const override { return "hashid decode [--hasher <name> | --type <type>] <hash>..."; }
    const char* helpDescription() const override { return "Decode each <hash> with the selected hasher and print one value per line. Hashes that do not decode are printed unchanged."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--hasher <name>", "Use the named hasher from the registry (default: \"default\")"},
            {"--type <type>", "Use an ad-hoc hasher of type default, secure or custom"}
        };
    }
};

}
