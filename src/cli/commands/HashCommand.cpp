#include "cli/commands/HashCommand.hpp"

#include <iostream>

#include "cli/CommandArgs.hpp"

namespace saltline {

Expected<void> HashCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parseCommandArgs(args, {"--scheme", "--rounds", "--salt-size", "--category"});
    if (!parsed) return parsed.error();
    const CommandArgs& a = parsed.value();
    if (a.positionals.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "usage: " + std::string(helpSynopsis())};
    }
    auto request = requestFromArgs(a);
    if (!request) return request.error();

    auto hash = ctx.hashes.encrypt(a.positionals.front(), a.option("--scheme"), request.value(), a.option("--category"));
    if (!hash) return hash.error();
    std::cout << hash.value() << "\n";
    return {};
}

}
