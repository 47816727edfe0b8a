#pragma once

#include <memory>

#include "core/FieldGrammar.hpp"
#include "core/Handler.hpp"

namespace saltline {

/**
 * @brief SHA-512-crypt as specified by Ulrich Drepper
 *
 * Format: $6$[rounds=<n>$]<salt>$<checksum>
 * The rounds field is left out only when rounds is 5000 and was not
 * requested explicitly.
 */
class Sha512CryptHandler : public GenericHandler {
public:
    Sha512CryptHandler();

    static std::shared_ptr<const IHandler> create();

    std::string computeChecksum(const std::string& secret, const Settings& settings) const override;

    static constexpr uint32_t IMPLICIT_ROUNDS = 5000;

protected:
    Expected<Settings> parseFields(const std::string& hash) const override;
    std::string renderFields(const Settings& settings) const override;

private:
    FieldGrammar grammar;
};

}
