#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "core/Handler.hpp"
#include "util/Expected.hpp"

namespace saltline {

/**
 * @brief Name -> handler lookup
 *
 * Handlers are registered once and never replaced. Registration takes an
 * exclusive lock and lookups a shared one, so a registry can be read from
 * any number of threads.
 */
class HandlerRegistry {
public:
    HandlerRegistry() = default;
    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    /**
     * @brief Process-wide registry holding the builtin handlers
     *
     * Populated on first use. Throws std::logic_error if a builtin handler
     * fails validation, since nothing can work after that.
     */
    static HandlerRegistry& global();

    /// MisconfiguredHandler if its HandlerSpec does not validate or the name is taken
    Expected<void> registerHandler(std::shared_ptr<const IHandler> handler);

    /// nullptr if no handler has that name
    std::shared_ptr<const IHandler> get(const std::string& name) const;

    /// UnknownScheme if no handler has that name
    Expected<std::shared_ptr<const IHandler>> find(const std::string& name) const;

    bool has(const std::string& name) const;

    /// Registered names in sorted order
    std::vector<std::string> names() const;

private:
    mutable std::shared_mutex mutex;
    std::map<std::string, std::shared_ptr<const IHandler>> handlers;
};

}
