#pragma once

#include "cli/ICommand.hpp"

namespace saltline {

class PolicyCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "policy"; }
    const char* description() const override { return "Print the active policy"; }
    const char* helpNameLine() const override { return "policy - Print the active policy as ini text"; }
    const char* helpSynopsis() const override { return "saltline policy"; }
    const char* helpDescription() const override {
        return "Print the active policy in canonical form. The output can be saved and loaded again with --config.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
