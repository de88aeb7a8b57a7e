#include "cli/HasherSelection.hpp"

#include <optional>

#include "core/Errors.hpp"
#include "core/HasherFactory.hpp"
#include "core/HasherRegistry.hpp"
#include "hasher/HashidsConverter.hpp"

namespace hashid {

Expected<HasherSelection> selectHasher(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!ctx.registry) {
        return Error{ErrorCode::InternalError, "No hasher registry configured"};
    }

    std::optional<std::string> hasherName;
    std::optional<std::string> typeName;
    HasherSelection selection;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--hasher" || arg == "--type") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, arg + " requires a value"};
            }
            (arg == "--hasher" ? hasherName : typeName) = args[++i];
        } else {
            selection.operands.push_back(arg);
        }
    }
    if (hasherName && typeName) {
        return Error{ErrorCode::InvalidArgs, "--hasher and --type are mutually exclusive"};
    }

    try {
        if (typeName) {
            selection.hasher = ctx.registry->factory()->create(*typeName);
        } else {
            selection.hasher = ctx.registry->getConverter(hasherName.value_or("default"));
        }
    } catch (const HashIdException& e) {
        return e.toError();
    }
    return selection;
}

}
