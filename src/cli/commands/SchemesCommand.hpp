#pragma once

#include "cli/ICommand.hpp"

namespace saltline {

class SchemesCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "schemes"; }
    const char* description() const override { return "List the schemes of the active policy"; }
    const char* helpNameLine() const override { return "schemes - List configured schemes"; }
    const char* helpSynopsis() const override { return "saltline schemes"; }
    const char* helpDescription() const override {
        return "List the active policy's schemes in identification order, marking the default and "
               "deprecated ones.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
