#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace saltline {

/**
 * @brief Runs a command and reports its failure
 *
 * Errors are logged once here so commands only return them. Exceptions
 * from the crypto layer become InternalError.
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
