#pragma once

#include "cli/ICommand.hpp"

namespace saltline {

class VerifyCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "verify"; }
    const char* description() const override { return "Check a secret against a hash"; }
    const char* helpNameLine() const override { return "verify - Check a secret against a hash"; }
    const char* helpSynopsis() const override { return "saltline verify [--scheme <name>] <secret> <hash>"; }
    const char* helpDescription() const override {
        return "Identify the scheme of <hash> (or use --scheme) and check <secret> against it. "
               "Exits with status 0 only if the secret matches.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {{"--scheme <name>", "Require the hash to belong to this scheme"}};
    }
};

}
