#include "cli/commands/VerifyCommand.hpp"

#include <iostream>

#include "cli/CommandArgs.hpp"

namespace saltline {

Expected<void> VerifyCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parseCommandArgs(args, {"--scheme"});
    if (!parsed) return parsed.error();
    const CommandArgs& a = parsed.value();
    if (a.positionals.size() != 2) {
        return Error{ErrorCode::InvalidArgs, "usage: " + std::string(helpSynopsis())};
    }

    auto ok = ctx.hashes.verify(a.positionals[0], a.positionals[1], a.option("--scheme"));
    if (!ok) return ok.error();
    if (!ok.value()) {
        std::cout << "no match\n";
        return Error{ErrorCode::Mismatch, "secret does not match hash"};
    }
    std::cout << "match\n";
    return {};
}

}
