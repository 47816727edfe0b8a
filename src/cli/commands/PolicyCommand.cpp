#include "cli/commands/PolicyCommand.hpp"

#include <iostream>

namespace saltline {

Expected<void> PolicyCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "policy takes no arguments"};
    }
    std::cout << ctx.hashes.policy().toString();
    return {};
}

}
