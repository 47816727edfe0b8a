#include "cli/AppSetup.hpp"

#include <cstdlib>
#include <stdexcept>

#include "util/Logger.hpp"

namespace saltline {

Policy builtinPolicy() {
    // cta_pbkdf2_sha1 and dlitz_pbkdf2_sha1 share "$p5k2$"; cta is tried first
    auto policy = Policy::fromMap({
        {"schemes", "pbkdf2_sha256, pbkdf2_sha512, pbkdf2_sha1, sha512_crypt, cta_pbkdf2_sha1, "
                    "dlitz_pbkdf2_sha1, atlassian_pbkdf2_sha1, grub_pbkdf2_sha512, "
                    "ldap_pbkdf2_sha1, ldap_pbkdf2_sha256, ldap_pbkdf2_sha512"},
        {"default", "pbkdf2_sha256"},
    });
    if (!policy) {
        throw std::logic_error("builtin policy is invalid: " + policy.error().message);
    }
    return policy.value();
}

Expected<AppContext> loadAppContext(const std::optional<std::filesystem::path>& configPath) {
    std::optional<std::filesystem::path> path = configPath;
    if (!path) {
        const char* env = std::getenv(CONFIG_ENV);
        if (env && *env) path = std::filesystem::path(env);
    }

    Policy policy = builtinPolicy();
    if (path) {
        auto loaded = Policy::fromSources({PolicySource::fromPolicy(policy), PolicySource::fromPath(*path)});
        if (!loaded) return loaded.error();
        policy = loaded.value();
    } else {
        Logger::instance().debug("no policy file, using the builtin policy");
    }

    auto hashes = HashContext::create(policy);
    if (!hashes) return hashes.error();
    return AppContext{hashes.value()};
}

}
