#pragma once

#include "cli/ICommand.hpp"

namespace saltline {

class IdentifyCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "identify"; }
    const char* description() const override { return "Name the scheme a hash belongs to"; }
    const char* helpNameLine() const override { return "identify - Name the scheme of a hash"; }
    const char* helpSynopsis() const override { return "saltline identify <hash>"; }
    const char* helpDescription() const override {
        return "Print the name of the first policy scheme that recognizes <hash>, or \"unknown\" "
               "(exit status 1) if none does.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
