#pragma once

#include <memory>
#include <vector>

#include "core/Handler.hpp"
#include "util/Expected.hpp"

namespace saltline {

class HandlerRegistry;

/// One fresh instance of every builtin handler
std::vector<std::shared_ptr<const IHandler>> builtinHandlers();

/// Register builtinHandlers() into registry; stops at the first failure
Expected<void> registerBuiltinHandlers(HandlerRegistry& registry);

}
