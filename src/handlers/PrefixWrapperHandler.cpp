#include "handlers/PrefixWrapperHandler.hpp"

#include <stdexcept>

#include "handlers/Pbkdf2DigestHandler.hpp"

namespace saltline {

PrefixWrapperHandler::PrefixWrapperHandler(std::string handlerName, std::shared_ptr<const IHandler> wrapped,
                                           std::string identPrefix)
    : inner(std::move(wrapped)), prefix(std::move(identPrefix)) {
    if (!inner) {
        throw std::invalid_argument("PrefixWrapperHandler: nothing to wrap");
    }
    origPrefix = inner->spec().idents.front();
    wrapperSpec = inner->spec();
    wrapperSpec.name = std::move(handlerName);
    wrapperSpec.idents = {prefix};
    wrapperSpec.description = "'" + prefix + "' spelling of " + inner->name();
}

std::shared_ptr<const IHandler> PrefixWrapperHandler::createLdapPbkdf2(const std::string& digest) {
    std::string ldapPrefix;
    if (digest == "sha1") ldapPrefix = "{PBKDF2}";
    else if (digest == "sha256") ldapPrefix = "{PBKDF2-SHA256}";
    else if (digest == "sha512") ldapPrefix = "{PBKDF2-SHA512}";
    else throw std::invalid_argument("no ldap pbkdf2 variant for digest " + digest);
    return std::make_shared<PrefixWrapperHandler>("ldap_pbkdf2_" + digest, Pbkdf2DigestHandler::create(digest), ldapPrefix);
}

Expected<std::string> PrefixWrapperHandler::unwrap(const std::string& hash) const {
    if (hash.compare(0, prefix.size(), prefix) != 0) {
        return Error{ErrorCode::InvalidHash, "not a " + name() + " hash"};
    }
    return origPrefix + hash.substr(prefix.size());
}

std::string PrefixWrapperHandler::wrap(const std::string& hash) const {
    if (hash.compare(0, origPrefix.size(), origPrefix) != 0) {
        throw std::logic_error(name() + ": wrapped handler rendered an unexpected prefix");
    }
    return prefix + hash.substr(origPrefix.size());
}

Expected<std::string> PrefixWrapperHandler::wrap(const Expected<std::string>& hash) const {
    if (!hash) return hash.error();
    return wrap(hash.value());
}

bool PrefixWrapperHandler::identify(const std::string& hash) const {
    auto orig = unwrap(hash);
    return orig && inner->identify(orig.value());
}

Expected<Settings> PrefixWrapperHandler::fromString(const std::string& hash) const {
    auto orig = unwrap(hash);
    if (!orig) return orig.error();
    return inner->fromString(orig.value());
}

std::string PrefixWrapperHandler::toString(const Settings& settings) const {
    return wrap(inner->toString(settings));
}

std::string PrefixWrapperHandler::computeChecksum(const std::string& secret, const Settings& settings) const {
    return inner->computeChecksum(secret, settings);
}

Expected<std::string> PrefixWrapperHandler::generateConfig(const SettingsRequest& request) const {
    return wrap(inner->generateConfig(request));
}

Expected<std::string> PrefixWrapperHandler::generateHash(const std::string& secret, const std::string& config) const {
    auto orig = unwrap(config);
    if (!orig) return orig.error();
    return wrap(inner->generateHash(secret, orig.value()));
}

Expected<std::string> PrefixWrapperHandler::encrypt(const std::string& secret, const SettingsRequest& request) const {
    return wrap(inner->encrypt(secret, request));
}

Expected<bool> PrefixWrapperHandler::verify(const std::string& secret, const std::string& hash) const {
    auto orig = unwrap(hash);
    if (!orig) return orig.error();
    return inner->verify(secret, orig.value());
}

}
