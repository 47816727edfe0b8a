#pragma once

#include <memory>
#include <string>

#include "core/FieldGrammar.hpp"
#include "core/Handler.hpp"

namespace saltline {

/// Parameters that distinguish pbkdf2_sha1 / pbkdf2_sha256 / pbkdf2_sha512
struct Pbkdf2Variant {
    std::string name;
    std::string digest;
    size_t checksumSize;
    std::string ident;
};

/// Variant for "sha1", "sha256" or "sha512"; throws std::invalid_argument for anything else
Pbkdf2Variant makePbkdf2Variant(const std::string& digest);

/**
 * @brief $pbkdf2-<digest>$<rounds>$<salt>$<checksum>
 *
 * Salt and checksum are adapted base64. sha1 uses the bare "$pbkdf2$" ident.
 */
class Pbkdf2DigestHandler : public GenericHandler {
public:
    explicit Pbkdf2DigestHandler(Pbkdf2Variant variant);

    static std::shared_ptr<const IHandler> create(const std::string& digest);

    std::string computeChecksum(const std::string& secret, const Settings& settings) const override;

    const Pbkdf2Variant& variant() const { return pbkdf2; }

    static constexpr uint32_t DEFAULT_ROUNDS = 6400;

protected:
    Expected<Settings> parseFields(const std::string& hash) const override;
    std::string renderFields(const Settings& settings) const override;

private:
    Pbkdf2Variant pbkdf2;
    FieldGrammar grammar;
};

}
