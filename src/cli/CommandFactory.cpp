#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/GenConfigCommand.hpp"
#include "cli/commands/HashCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/IdentifyCommand.hpp"
#include "cli/commands/PolicyCommand.hpp"
#include "cli/commands/SchemesCommand.hpp"
#include "cli/commands/VerifyCommand.hpp"

namespace saltline {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

bool CommandFactory::has(const std::string& name) const {
    return creators.count(name) != 0;
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

void registerCommands(CommandFactory& f) {
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("hash", [] { return std::make_unique<HashCommand>(); });
    f.registerCreator("verify", [] { return std::make_unique<VerifyCommand>(); });
    f.registerCreator("identify", [] { return std::make_unique<IdentifyCommand>(); });
    f.registerCreator("genconfig", [] { return std::make_unique<GenConfigCommand>(); });
    f.registerCreator("schemes", [] { return std::make_unique<SchemesCommand>(); });
    f.registerCreator("policy", [] { return std::make_unique<PolicyCommand>(); });
}

}
