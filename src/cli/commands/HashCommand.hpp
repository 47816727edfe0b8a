#pragma once

#include "cli/ICommand.hpp"

namespace saltline {

class HashCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "hash"; }
    const char* description() const override { return "Hash a secret under the active policy"; }
    const char* helpNameLine() const override { return "hash - Hash a secret"; }
    const char* helpSynopsis() const override { return "saltline hash [--scheme <name>] [--rounds <n>] [--salt-size <n>] [--category <name>] <secret>"; }
    const char* helpDescription() const override {
        return "Hash <secret> with the policy's default scheme, or with --scheme. Rounds and salt size come from the "
               "policy unless given on the command line. The hash is printed on stdout.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--scheme <name>", "Scheme to use instead of the policy default"},
            {"--rounds <n>", "Rounds to use instead of the policy's default_rounds"},
            {"--salt-size <n>", "Salt size to use instead of the policy's salt_size"},
            {"--category <name>", "Apply the options of this policy category"},
        };
    }
};

}
