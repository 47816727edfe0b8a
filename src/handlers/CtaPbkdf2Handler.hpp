#pragma once

#include <memory>

#include "core/FieldGrammar.hpp"
#include "core/Handler.hpp"

namespace saltline {

/// Cryptacular's PBKDF2-HMAC-SHA1: $p5k2$<hex rounds>$<salt>$<checksum>, base64 with "-_"
class CtaPbkdf2Handler : public GenericHandler {
public:
    CtaPbkdf2Handler();

    static std::shared_ptr<const IHandler> create();

    std::string computeChecksum(const std::string& secret, const Settings& settings) const override;

protected:
    Expected<Settings> parseFields(const std::string& hash) const override;
    std::string renderFields(const Settings& settings) const override;

private:
    FieldGrammar grammar;
};

}
