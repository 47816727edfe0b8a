#include "cli/CommandInvoker.hpp"

#include <stdexcept>

#include "util/Logger.hpp"

namespace saltline {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    Expected<void> res;
    try {
        res = cmd.execute(ctx, args);
    } catch (const std::exception& e) {
        res = Error{ErrorCode::InternalError, e.what()};
    }
    if (!res) {
        const std::string line = std::string(cmd.name()) + ": " + res.error().message;
        if (res.error().code == ErrorCode::Mismatch) {
            Logger::instance().info(line);
        } else {
            Logger::instance().error(line + " [" + errorCodeName(res.error().code) + "]");
        }
    }
    return res;
}

}
