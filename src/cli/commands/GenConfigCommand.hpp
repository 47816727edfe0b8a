#pragma once

#include "cli/ICommand.hpp"

namespace saltline {

class GenConfigCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "genconfig"; }
    const char* description() const override { return "Print a config string (salt and rounds, no checksum)"; }
    const char* helpNameLine() const override { return "genconfig - Generate a config string"; }
    const char* helpSynopsis() const override { return "saltline genconfig [--scheme <name>] [--rounds <n>] [--salt-size <n>] [--category <name>]"; }
    const char* helpDescription() const override {
        return "Generate a fresh salt and rounds setting for a scheme and print them in the scheme's format, "
               "without a checksum.";
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
