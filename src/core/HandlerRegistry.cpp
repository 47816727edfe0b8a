#include "core/HandlerRegistry.hpp"

#include <functional>
#include <mutex>
#include <stdexcept>

#include "handlers/BuiltinHandlers.hpp"
#include "util/Logger.hpp"

namespace saltline {

static void fillBuiltins(HandlerRegistry& registry) {
    auto res = registerBuiltinHandlers(registry);
    if (!res) {
        throw std::logic_error("builtin handler registration failed: " + res.error().message);
    }
}

HandlerRegistry& HandlerRegistry::global() {
    static HandlerRegistry registry;
    static std::once_flag filled;
    std::call_once(filled, fillBuiltins, std::ref(registry));
    return registry;
}

Expected<void> HandlerRegistry::registerHandler(std::shared_ptr<const IHandler> handler) {
    if (!handler) {
        return Error{ErrorCode::MisconfiguredHandler, "cannot register a null handler"};
    }
    auto valid = handler->spec().validate();
    if (!valid) return valid;

    std::unique_lock<std::shared_mutex> lock(mutex);
    const std::string& name = handler->name();
    if (handlers.count(name)) {
        return Error{ErrorCode::MisconfiguredHandler, "a handler named '" + name + "' is already registered"};
    }
    handlers.emplace(name, std::move(handler));
    Logger::instance().debug("registered handler " + name);
    return {};
}

std::shared_ptr<const IHandler> HandlerRegistry::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = handlers.find(name);
    if (it == handlers.end()) return nullptr;
    return it->second;
}

Expected<std::shared_ptr<const IHandler>> HandlerRegistry::find(const std::string& name) const {
    auto handler = get(name);
    if (!handler) {
        return Error{ErrorCode::UnknownScheme, "unknown hash scheme: " + name};
    }
    return handler;
}

bool HandlerRegistry::has(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return handlers.count(name) != 0;
}

std::vector<std::string> HandlerRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    std::vector<std::string> out;
    out.reserve(handlers.size());
    for (const auto& kv : handlers) out.push_back(kv.first);
    return out;
}

}
