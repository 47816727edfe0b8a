#pragma once

#include <filesystem>
#include <optional>

#include "cli/ICommand.hpp"
#include "core/Policy.hpp"

namespace saltline {

/// Environment variable naming a policy file when --config is not given
constexpr const char* CONFIG_ENV = "SALTLINE_CONFIG";

/// Every builtin scheme, default pbkdf2_sha256
Policy builtinPolicy();

/**
 * @brief Build the command context
 *
 * The policy comes from configPath, else from $SALTLINE_CONFIG, else
 * builtinPolicy(). A policy file is layered over builtinPolicy(), so it
 * only has to name what it changes.
 */
Expected<AppContext> loadAppContext(const std::optional<std::filesystem::path>& configPath);

}
