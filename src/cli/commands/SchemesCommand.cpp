#include "cli/commands/SchemesCommand.hpp"

#include <iostream>

namespace saltline {

Expected<void> SchemesCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "schemes takes no arguments"};
    }
    auto def = ctx.hashes.defaultHandler();
    for (const auto& handler : ctx.hashes.handlers()) {
        std::cout << handler->name();
        if (def && def->name() == handler->name()) std::cout << " (default)";
        if (ctx.hashes.handlerIsDeprecated(*handler)) std::cout << " (deprecated)";
        std::cout << "\t" << handler->spec().description << "\n";
    }
    return {};
}

}
