#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/Handler.hpp"
#include "util/Expected.hpp"

namespace saltline {

/// Arguments of one command split into "--flag value" options and positionals
struct CommandArgs {
    std::map<std::string, std::string> options;
    std::vector<std::string> positionals;

    std::optional<std::string> option(const std::string& flag) const;
};

/**
 * @brief Split args
 *
 * Accepts "--flag value" and "--flag=value" for every flag in valueFlags.
 * "--" ends option parsing. Unknown flags and missing values are InvalidArgs.
 */
Expected<CommandArgs> parseCommandArgs(const std::vector<std::string>& args,
                                       const std::vector<std::string>& valueFlags);

/// Non-negative decimal that fits in 32 bits
Expected<uint32_t> parseCount(const std::string& flag, const std::string& text);

/// SettingsRequest from --rounds and --salt-size
Expected<SettingsRequest> requestFromArgs(const CommandArgs& args);

}
