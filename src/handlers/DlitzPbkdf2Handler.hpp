#pragma once

#include <memory>

#include "core/FieldGrammar.hpp"
#include "core/Handler.hpp"

namespace saltline {

/**
 * @brief Dwayne Litzenberger's PBKDF2-HMAC-SHA1: $p5k2$[<hex rounds>]$<salt>$<checksum>
 *
 * The checksum is keyed with the config string itself, not the bare salt.
 * An empty rounds field means 400 iterations, and 400 is always written
 * as an empty field.
 */
class DlitzPbkdf2Handler : public GenericHandler {
public:
    DlitzPbkdf2Handler();

    static std::shared_ptr<const IHandler> create();

    std::string computeChecksum(const std::string& secret, const Settings& settings) const override;

    static constexpr uint32_t IMPLICIT_ROUNDS = 400;

protected:
    Expected<Settings> parseFields(const std::string& hash) const override;
    std::string renderFields(const Settings& settings) const override;

private:
    FieldGrammar grammar;
};

}
