#include "handlers/BuiltinHandlers.hpp"

#include "core/HandlerRegistry.hpp"
#include "handlers/AtlassianPbkdf2Handler.hpp"
#include "handlers/CtaPbkdf2Handler.hpp"
#include "handlers/DlitzPbkdf2Handler.hpp"
#include "handlers/GrubPbkdf2Handler.hpp"
#include "handlers/Pbkdf2DigestHandler.hpp"
#include "handlers/PrefixWrapperHandler.hpp"
#include "handlers/Sha512CryptHandler.hpp"

namespace saltline {

std::vector<std::shared_ptr<const IHandler>> builtinHandlers() {
    return {
        Pbkdf2DigestHandler::create("sha1"),
        Pbkdf2DigestHandler::create("sha256"),
        Pbkdf2DigestHandler::create("sha512"),
        CtaPbkdf2Handler::create(),
        DlitzPbkdf2Handler::create(),
        AtlassianPbkdf2Handler::create(),
        GrubPbkdf2Handler::create(),
        Sha512CryptHandler::create(),
        PrefixWrapperHandler::createLdapPbkdf2("sha1"),
        PrefixWrapperHandler::createLdapPbkdf2("sha256"),
        PrefixWrapperHandler::createLdapPbkdf2("sha512"),
    };
}

Expected<void> registerBuiltinHandlers(HandlerRegistry& registry) {
    for (auto& handler : builtinHandlers()) {
        auto res = registry.registerHandler(handler);
        if (!res) return res;
    }
    return {};
}

}
