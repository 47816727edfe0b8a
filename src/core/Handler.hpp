#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/HandlerSpec.hpp"
#include "util/Expected.hpp"

namespace saltline {

/**
 * @brief Decoded content of one hash or config string
 *
 * salt holds raw bytes for raw-salt handlers and the literal salt text
 * for character-salt handlers. checksum holds decoded bytes; a Settings
 * without a checksum is a config.
 */
struct Settings {
    std::string salt;
    std::optional<uint32_t> rounds;
    bool roundsExplicit{false};
    std::optional<std::string> checksum;

    bool isHash() const { return checksum.has_value(); }
};

/// What a caller asks for when generating a config
struct SettingsRequest {
    std::optional<std::string> salt;
    std::optional<size_t> saltSize;
    std::optional<uint32_t> rounds;
    std::optional<bool> implicitRounds;   // unset means true
    bool strict{false};
};

/**
 * @brief Contract every hash scheme implements
 *
 * Implementations are immutable once registered and safe to share between
 * threads. Malformed or foreign input produces an error or false, never a
 * crash.
 */
class IHandler {
public:
    virtual ~IHandler() = default;

    virtual const std::string& name() const = 0;
    virtual const HandlerSpec& spec() const = 0;

    /// True if hash belongs to this scheme and parses
    virtual bool identify(const std::string& hash) const = 0;

    /// Parse and validate; every failure is InvalidHash
    virtual Expected<Settings> fromString(const std::string& hash) const = 0;

    /// Render settings; with a checksum the result is a hash, otherwise a config
    virtual std::string toString(const Settings& settings) const = 0;

    /// Raw checksum bytes for secret under settings (checksum field ignored)
    virtual std::string computeChecksum(const std::string& secret, const Settings& settings) const = 0;

    virtual Expected<std::string> generateConfig(const SettingsRequest& request) const = 0;
    virtual Expected<std::string> generateHash(const std::string& secret, const std::string& config) const = 0;
    virtual Expected<std::string> encrypt(const std::string& secret, const SettingsRequest& request) const = 0;

    /// InvalidHash if hash is malformed or only a config
    virtual Expected<bool> verify(const std::string& secret, const std::string& hash) const = 0;
};

/**
 * @brief Shared implementation of the handler contract
 *
 * Subclasses supply the wire format (parseFields/renderFields) and the
 * digest (computeChecksum). This class owns normalization, checksum size
 * checks, config and hash generation and constant-time verification.
 */
class GenericHandler : public IHandler {
public:
    const std::string& name() const override { return handlerSpec.name; }
    const HandlerSpec& spec() const override { return handlerSpec; }

    bool identify(const std::string& hash) const override;
    Expected<Settings> fromString(const std::string& hash) const override;
    std::string toString(const Settings& settings) const override;
    Expected<std::string> generateConfig(const SettingsRequest& request) const override;
    Expected<std::string> generateHash(const std::string& secret, const std::string& config) const override;
    Expected<std::string> encrypt(const std::string& secret, const SettingsRequest& request) const override;
    Expected<bool> verify(const std::string& secret, const std::string& hash) const override;

protected:
    explicit GenericHandler(HandlerSpec spec);

    /// Split and decode the fields of hash without any bounds checks
    virtual Expected<Settings> parseFields(const std::string& hash) const = 0;

    /// Encode settings into the scheme's text form
    virtual std::string renderFields(const Settings& settings) const = 0;

    bool hasIdentPrefix(const std::string& hash) const;

private:
    HandlerSpec handlerSpec;

    Expected<Settings> normalize(Settings settings, bool strict) const;
};

}
