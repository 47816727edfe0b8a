#include "cli/CommandArgs.hpp"

#include <algorithm>

namespace saltline {

std::optional<std::string> CommandArgs::option(const std::string& flag) const {
    auto it = options.find(flag);
    if (it == options.end()) return std::nullopt;
    return it->second;
}

Expected<CommandArgs> parseCommandArgs(const std::vector<std::string>& args,
                                       const std::vector<std::string>& valueFlags) {
    CommandArgs out;
    bool optionsDone = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (optionsDone || arg.size() < 2 || arg.compare(0, 2, "--") != 0) {
            out.positionals.push_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsDone = true;
            continue;
        }
        std::string flag = arg;
        std::optional<std::string> value;
        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            flag = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }
        if (std::find(valueFlags.begin(), valueFlags.end(), flag) == valueFlags.end()) {
            return Error{ErrorCode::InvalidArgs, "unknown option " + flag};
        }
        if (!value) {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, flag + " requires a value"};
            }
            value = args[++i];
        }
        out.options[flag] = *value;
    }
    return out;
}

Expected<uint32_t> parseCount(const std::string& flag, const std::string& text) {
    if (text.empty()) return Error{ErrorCode::InvalidArgs, flag + " requires a number"};
    uint64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return Error{ErrorCode::InvalidArgs, flag + ": not a number: " + text};
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > UINT32_MAX) return Error{ErrorCode::InvalidArgs, flag + ": number too large"};
    }
    return static_cast<uint32_t>(v);
}

Expected<SettingsRequest> requestFromArgs(const CommandArgs& args) {
    SettingsRequest req;
    if (auto rounds = args.option("--rounds")) {
        auto n = parseCount("--rounds", *rounds);
        if (!n) return n.error();
        req.rounds = n.value();
    }
    if (auto size = args.option("--salt-size")) {
        auto n = parseCount("--salt-size", *size);
        if (!n) return n.error();
        req.saltSize = n.value();
    }
    return req;
}

}
