// hashid CLI: encode/decode identifiers through the hasher registry.

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/DecodeCommand.hpp"
#include "cli/commands/EncodeCommand.hpp"
#include "cli/commands/HashersCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/SaltCommand.hpp"
#include "cli/commands/TypesCommand.hpp"
#include "codec/HashidsCodec.hpp"
#include "config/ConfigLoader.hpp"
#include "core/HasherFactory.hpp"
#include "core/HasherRegistry.hpp"
#include "util/Logger.hpp"

using namespace hashid;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("encode", [] { return std::make_unique<EncodeCommand>(); });
    f.registerCreator("decode", [] { return std::make_unique<DecodeCommand>(); });
    f.registerCreator("types", [] { return std::make_unique<TypesCommand>(); });
    f.registerCreator("hashers", [] { return std::make_unique<HashersCommand>(); });
    f.registerCreator("salt", [] { return std::make_unique<SaltCommand>(); });
}

// Registry from --config, HASHID_CONFIG, or built-in defaults
static Expected<std::shared_ptr<HasherRegistry>> buildRegistry(const std::string& configPath) {
    CodecProvider codecs = HashidsCodec::create;
    if (configPath.empty()) {
        return std::make_shared<HasherRegistry>(std::make_shared<HasherFactory>(codecs));
    }
    auto config = ConfigLoader::load(configPath);
    if (!config) {
        return config.error();
    }
    return ConfigLoader::apply(config.value(), codecs);
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    std::string configPath;
    if (const char* env = std::getenv("HASHID_CONFIG")) {
        configPath = env;
    }
    if (args.size() >= 2 && args.front() == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    CommandInvoker invoker;
    AppContext ctx{};
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        invoker.invoke(*cmd, ctx, {});
        return 0;
    }

    auto registry = buildRegistry(configPath);
    if (!registry) {
        Logger::instance().error(registry.error().message);
        return 1;
    }
    ctx.registry = registry.value();

    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
