#include "config/ConfigLoader.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

#include "core/Errors.hpp"
#include "core/HasherFactory.hpp"
#include "core/HasherRegistry.hpp"
#include "util/Logger.hpp"

namespace hashid {
namespace ConfigLoader {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

Error lineError(size_t lineNo, const std::string& what) {
    return Error{ErrorCode::InvalidArgs, "line " + std::to_string(lineNo) + ": " + what};
}

std::optional<int> parseInteger(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed, 10);
        if (consumed != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

enum class Section { None, Factory, Hasher };

}

Expected<HashidConfig> load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot read config file: " + path.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto res = parse(buffer.str());
    if (!res) {
        return Error{res.error().code, path.string() + ": " + res.error().message};
    }
    return res;
}

Expected<HashidConfig> parse(const std::string& text) {
    HashidConfig config;
    Section section = Section::None;
    std::string hasherName;

    std::istringstream in(text);
    std::string raw;
    size_t lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                return lineError(lineNo, "unterminated section header");
            }
            std::string header = trim(line.substr(1, line.size() - 2));
            if (header == "factory") {
                section = Section::Factory;
                continue;
            }
            if (header.rfind("hasher", 0) == 0) {
                std::string rest = trim(header.substr(6));
                if (rest.size() < 3 || rest.front() != '"' || rest.back() != '"') {
                    return lineError(lineNo, "expected [hasher \"<name>\"]");
                }
                std::string name = unquote(rest);
                if (config.hashers.count(name)) {
                    return lineError(lineNo, "duplicate hasher section: " + name);
                }
                config.hashers[name] = HasherOptions{};
                hasherName = name;
                section = Section::Hasher;
                continue;
            }
            return lineError(lineNo, "unknown section: " + header);
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            return lineError(lineNo, "expected key = value");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        try {
            if (section == Section::Factory) {
                if (key == "max_cache_size") {
                    auto size = parseInteger(value);
                    if (!size) {
                        return lineError(lineNo, "max_cache_size must be an integer");
                    }
                    config.maxCacheSize = *size;
                    continue;
                }
                auto options = HasherOptions::fromMap({{key, value}});
                config.factoryDefaults = mergeConfig(options, {}, config.factoryDefaults);
            } else if (section == Section::Hasher) {
                auto options = HasherOptions::fromMap({{key, value}});
                HasherOptions& target = config.hashers[hasherName];
                if (options.salt) target.salt = options.salt;
                if (options.minLength) target.minLength = options.minLength;
                if (options.alphabet) target.alphabet = options.alphabet;
            } else {
                return lineError(lineNo, "key outside of a section: " + key);
            }
        } catch (const ConfigurationValidationError& e) {
            return lineError(lineNo, e.what());
        }
    }
    return config;
}

Expected<std::shared_ptr<HasherRegistry>> apply(const HashidConfig& config, CodecProvider codecs,
                                                EnvResolver resolver) {
    try {
        auto factory = std::make_shared<HasherFactory>(
            std::move(codecs), config.factoryDefaults.salt, config.factoryDefaults.minLength,
            config.factoryDefaults.alphabet, config.maxCacheSize);
        auto registry = std::make_shared<HasherRegistry>(factory, std::move(resolver));
        registry->registerHashers(config.hashers);

        for (const auto& [name, options] : config.hashers) {
            std::string salt = options.salt ? *options.salt : config.factoryDefaults.salt;
            if (salt.empty()) {
                Logger::instance().warn("Hasher " + name + " uses an empty salt");
            }
        }
        return registry;
    } catch (const HashIdException& e) {
        return e.toError();
    }
}

}
}
