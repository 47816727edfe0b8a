// saltline command line: [--config FILE] <command> [args...]

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cli/AppSetup.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "util/Logger.hpp"

using namespace saltline;

namespace {

constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

/// Strips leading "--config FILE" / "--config=FILE" flags; the last one wins
Expected<std::optional<std::filesystem::path>> takeConfigFlag(std::vector<std::string>& args) {
    const std::string flag = "--config";
    std::optional<std::filesystem::path> path;
    while (!args.empty() && args.front().compare(0, flag.size(), flag) == 0) {
        std::string arg = args.front();
        args.erase(args.begin());
        if (arg.size() > flag.size() + 1 && arg[flag.size()] == '=') {
            path = arg.substr(flag.size() + 1);
        } else if (arg == flag && !args.empty()) {
            path = args.front();
            args.erase(args.begin());
        } else {
            return Error{ErrorCode::InvalidArgs, "--config requires a file"};
        }
    }
    return path;
}

int runHelp(CommandInvoker& invoker) {
    auto help = CommandFactory::instance().create("help");
    return invoker.invoke(*help, AppContext{}, {}) ? 0 : EXIT_FAILED;
}

}

int main(int argc, char** argv) {
    registerCommands(CommandFactory::instance());
    std::vector<std::string> args(argv + 1, argv + argc);

    auto configPath = takeConfigFlag(args);
    if (!configPath) {
        std::cerr << configPath.error().message << "\n";
        return EXIT_USAGE;
    }

    CommandInvoker invoker;
    if (args.empty()) return runHelp(invoker);

    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        runHelp(invoker);
        return EXIT_USAGE;
    }

    // help needs no policy, so a broken policy file does not hide it
    AppContext ctx;
    if (cmdName != "help") {
        auto loaded = loadAppContext(configPath.value());
        if (!loaded) {
            Logger::instance().error("cannot load policy: " + loaded.error().message);
            return EXIT_USAGE;
        }
        ctx = loaded.value();
    }
    return invoker.invoke(*cmd, ctx, args) ? 0 : EXIT_FAILED;
}
