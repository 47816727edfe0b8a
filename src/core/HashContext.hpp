#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Handler.hpp"
#include "core/HandlerRegistry.hpp"
#include "core/Policy.hpp"
#include "util/Expected.hpp"

namespace saltline {

/**
 * @brief A policy bound to the handlers it names
 *
 * Immutable after create(); copies share the handlers. All hashing
 * operations go through here so the policy's defaults, bounds and
 * deprecations are applied uniformly.
 */
class HashContext {
public:
    /// Empty context with no schemes; every operation reports UnknownScheme
    HashContext() = default;

    /**
     * @brief Bind policy to the global registry
     *
     * UnknownScheme if a scheme is not registered or the default scheme is
     * not one of the policy's schemes. Without a default, the first scheme
     * is used.
     */
    static Expected<HashContext> create(const Policy& policy);

    /// As create(policy), against registry; the context and its copies keep registry alive
    static Expected<HashContext> create(const Policy& policy, std::shared_ptr<const HandlerRegistry> registry);

    /// New context from policy().replace(overlay), against the same registry
    Expected<HashContext> replace(const Policy& overlay) const;

    const Policy& policy() const { return activePolicy; }
    const std::vector<std::shared_ptr<const IHandler>>& handlers() const { return schemeHandlers; }
    std::shared_ptr<const IHandler> defaultHandler() const { return fallback; }

    /// UnknownScheme if name is not one of this context's schemes
    Expected<std::shared_ptr<const IHandler>> findHandler(const std::string& name) const;

    /**
     * @brief Hash secret under scheme (or the default scheme)
     *
     * Options come from the policy for (scheme, category) and are then
     * overridden by overrides. Unless rounds are given, default_rounds is
     * jittered by vary_rounds. The result is clamped to the policy's
     * min_rounds/max_rounds.
     */
    Expected<std::string> encrypt(const std::string& secret,
                                  const std::optional<std::string>& scheme = std::nullopt,
                                  const SettingsRequest& overrides = {},
                                  const std::optional<std::string>& category = std::nullopt) const;

    /// Config string with the same option resolution as encrypt()
    Expected<std::string> genconfig(const std::optional<std::string>& scheme = std::nullopt,
                                    const SettingsRequest& overrides = {},
                                    const std::optional<std::string>& category = std::nullopt) const;

    /// Hash secret using the settings of config; scheme is identified from config when not given
    Expected<std::string> genhash(const std::string& secret, const std::string& config,
                                  const std::optional<std::string>& scheme = std::nullopt) const;

    /// First handler (in policy order) that recognizes hash; nullptr when none does unless required
    Expected<std::shared_ptr<const IHandler>> identifyHandler(const std::optional<std::string>& hash,
                                                              bool required = false) const;

    /// Scheme name of identifyHandler(), or nullopt for an unknown hash
    Expected<std::optional<std::string>> identify(const std::optional<std::string>& hash,
                                                  bool required = false) const;

    /**
     * @brief Check secret against hash
     *
     * An empty or absent hash is false without any digest work. With an
     * explicit scheme, a hash that does not belong to it is InvalidHash.
     * Without one, an unrecognized hash is UnknownScheme.
     */
    Expected<bool> verify(const std::string& secret, const std::optional<std::string>& hash,
                          const std::optional<std::string>& scheme = std::nullopt) const;

    bool handlerIsDeprecated(const std::string& scheme) const;
    bool handlerIsDeprecated(const IHandler& handler) const;

    /// True if hash uses a deprecated scheme or rounds outside the policy's min/max
    Expected<bool> hashNeedsUpdate(const std::string& hash,
                                   const std::optional<std::string>& category = std::nullopt) const;

    /**
     * @brief verify() plus migration
     *
     * Returns (matched, replacement). replacement is set only when the
     * secret matched and hashNeedsUpdate() is true; it is a fresh hash under
     * the default scheme.
     */
    Expected<std::pair<bool, std::optional<std::string>>> verifyAndUpdate(
        const std::string& secret, const std::string& hash,
        const std::optional<std::string>& category = std::nullopt) const;

private:
    Policy activePolicy;
    std::vector<std::shared_ptr<const IHandler>> schemeHandlers;
    std::shared_ptr<const IHandler> fallback;
    std::shared_ptr<const HandlerRegistry> registry;   // null means HandlerRegistry::global()

    static Expected<HashContext> bind(const Policy& policy, const HandlerRegistry& lookup,
                                      std::shared_ptr<const HandlerRegistry> owner);

    Expected<std::shared_ptr<const IHandler>> targetHandler(const std::optional<std::string>& scheme) const;
    SettingsRequest applyPolicy(const IHandler& handler, const SettingsRequest& overrides,
                                const std::optional<std::string>& category) const;
};

}
