#pragma once

#include <memory>
#include <string>

#include "core/Handler.hpp"

namespace saltline {

/**
 * @brief Presents another handler under a different ident
 *
 * Hashes are translated on the way in (prefix -> wrapped ident) and on the
 * way out (wrapped ident -> prefix). Everything else is the wrapped
 * handler's behavior. Used for the LDAP "{PBKDF2...}" spellings.
 */
class PrefixWrapperHandler : public IHandler {
public:
    PrefixWrapperHandler(std::string handlerName, std::shared_ptr<const IHandler> wrapped, std::string identPrefix);

    /// ldap_pbkdf2_sha1 / _sha256 / _sha512 around the matching pbkdf2 handler
    static std::shared_ptr<const IHandler> createLdapPbkdf2(const std::string& digest);

    const std::string& name() const override { return wrapperSpec.name; }
    const HandlerSpec& spec() const override { return wrapperSpec; }

    bool identify(const std::string& hash) const override;
    Expected<Settings> fromString(const std::string& hash) const override;
    std::string toString(const Settings& settings) const override;
    std::string computeChecksum(const std::string& secret, const Settings& settings) const override;
    Expected<std::string> generateConfig(const SettingsRequest& request) const override;
    Expected<std::string> generateHash(const std::string& secret, const std::string& config) const override;
    Expected<std::string> encrypt(const std::string& secret, const SettingsRequest& request) const override;
    Expected<bool> verify(const std::string& secret, const std::string& hash) const override;

    const IHandler& wrapped() const { return *inner; }

private:
    std::shared_ptr<const IHandler> inner;
    std::string prefix;
    std::string origPrefix;
    HandlerSpec wrapperSpec;

    /// prefix... -> origPrefix...; InvalidHash if hash lacks prefix
    Expected<std::string> unwrap(const std::string& hash) const;
    /// origPrefix... -> prefix...
    std::string wrap(const std::string& hash) const;
    Expected<std::string> wrap(const Expected<std::string>& hash) const;
};

}
