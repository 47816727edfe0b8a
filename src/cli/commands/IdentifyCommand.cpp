#include "cli/commands/IdentifyCommand.hpp"

#include <iostream>

namespace saltline {

Expected<void> IdentifyCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "usage: " + std::string(helpSynopsis())};
    }
    auto scheme = ctx.hashes.identify(args.front());
    if (!scheme) return scheme.error();
    if (!scheme.value()) {
        std::cout << "unknown\n";
        return Error{ErrorCode::UnknownScheme, "hash could not be identified"};
    }
    std::cout << *scheme.value() << "\n";
    return {};
}

}
