#include "cli/CommandInvoker.hpp"

#include "core/Errors.hpp"
#include "util/Logger.hpp"

namespace hashid {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    Expected<void> res;
    try {
        res = cmd.execute(ctx, args);
    } catch (const HashIdException& e) {
        res = e.toError();
    } catch (const std::exception& e) {
        res = Error{ErrorCode::InternalError, e.what()};
    }
    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message);
        return res;
    }
    return {};
}

}
