#pragma once

#include <memory>

#include "core/Handler.hpp"

namespace saltline {

/**
 * @brief Atlassian's PBKDF2-HMAC-SHA1: {PKCS5S2}<base64(salt || checksum)>
 *
 * Fixed 16-byte salt and 10000 iterations. There is no separate config
 * form, so a config carries an all-zero checksum.
 */
class AtlassianPbkdf2Handler : public GenericHandler {
public:
    AtlassianPbkdf2Handler();

    static std::shared_ptr<const IHandler> create();

    std::string computeChecksum(const std::string& secret, const Settings& settings) const override;

    static constexpr uint32_t ROUNDS = 10000;

protected:
    Expected<Settings> parseFields(const std::string& hash) const override;
    std::string renderFields(const Settings& settings) const override;
};

}
