#pragma once

#include "cli/ICommand.hpp"

namespace hashid {

class EncodeCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "encode"; }
    const char* description() const override { return "Encode numeric identifiers"; }
    const char* helpNameLine() const override { return "encode -  Encode identifiers into hashes"; }
    const char* helpSynopsis() const override { return "hashid encode [--hasher <name> | --type <type>] <value>..."; }
    const char* helpDescription() const override { return "Encode each <value> with the selected hasher and print one hash per line. Non-numeric values are printed unchanged."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--hasher <name>", "Use the named hasher from the registry (default: \"default\")"},
            {"--type <type>", "Use an ad-hoc hasher of type default, secure or custom"}
        };
    }
};

}
