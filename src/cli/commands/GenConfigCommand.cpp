#include "cli/commands/GenConfigCommand.hpp"

#include <iostream>

#include "cli/CommandArgs.hpp"

namespace saltline {

Expected<void> GenConfigCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parseCommandArgs(args, {"--scheme", "--rounds", "--salt-size", "--category"});
    if (!parsed) return parsed.error();
    const CommandArgs& a = parsed.value();
    if (!a.positionals.empty()) {
        return Error{ErrorCode::InvalidArgs, "unexpected argument: " + a.positionals.front()};
    }
    auto request = requestFromArgs(a);
    if (!request) return request.error();

    auto config = ctx.hashes.genconfig(a.option("--scheme"), request.value(), a.option("--category"));
    if (!config) return config.error();
    std::cout << config.value() << "\n";
    return {};
}

}
