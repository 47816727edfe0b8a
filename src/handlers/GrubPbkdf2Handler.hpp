#pragma once

#include <memory>

#include "core/FieldGrammar.hpp"
#include "core/Handler.hpp"

namespace saltline {

/// GRUB2's grub-mkpasswd-pbkdf2 format: grub.pbkdf2.sha512.<rounds>.<SALT>.<CHECKSUM>, upper-case hex
class GrubPbkdf2Handler : public GenericHandler {
public:
    GrubPbkdf2Handler();

    static std::shared_ptr<const IHandler> create();

    std::string computeChecksum(const std::string& secret, const Settings& settings) const override;

protected:
    Expected<Settings> parseFields(const std::string& hash) const override;
    std::string renderFields(const Settings& settings) const override;

private:
    FieldGrammar grammar;
};

}
