#include "core/Handler.hpp"

#include <openssl/crypto.h>

#include "core/SettingNormalizer.hpp"
#include "util/Logger.hpp"

namespace saltline {

GenericHandler::GenericHandler(HandlerSpec spec) : handlerSpec(std::move(spec)) {
    handlerSpec.resolveDefaults();
}

bool GenericHandler::hasIdentPrefix(const std::string& hash) const {
    for (const auto& ident : handlerSpec.idents) {
        if (hash.compare(0, ident.size(), ident) == 0) return true;
    }
    return false;
}

bool GenericHandler::identify(const std::string& hash) const {
    if (!hasIdentPrefix(hash)) return false;
    return fromString(hash).has_value();
}

Expected<Settings> GenericHandler::normalize(Settings settings, bool strict) const {
    SettingNormalizer norm(handlerSpec.name, strict);
    if (handlerSpec.rounds) {
        auto rounds = norm.normalizeRounds(settings.rounds, *handlerSpec.rounds);
        if (!rounds) return rounds.error();
        settings.rounds = rounds.value();
    }
    if (handlerSpec.salt) {
        auto salt = norm.normalizeSalt(settings.salt, std::nullopt, *handlerSpec.salt);
        if (!salt) return salt.error();
        settings.salt = salt.value();
    }
    return settings;
}

Expected<Settings> GenericHandler::fromString(const std::string& hash) const {
    if (!hasIdentPrefix(hash)) {
        return Error{ErrorCode::InvalidHash, "not a " + handlerSpec.name + " hash"};
    }
    auto parsed = parseFields(hash);
    if (!parsed) {
        return Error{ErrorCode::InvalidHash, parsed.error().message};
    }
    Settings settings = parsed.value();
    if (settings.checksum && settings.checksum->size() != handlerSpec.checksum.size) {
        return Error{ErrorCode::InvalidHash, handlerSpec.name + ": checksum has wrong size"};
    }

    // hashes must already satisfy the bounds; configs may be corrected
    auto normalized = normalize(std::move(settings), parsed.value().isHash());
    if (!normalized) {
        return Error{ErrorCode::InvalidHash, normalized.error().message};
    }
    return normalized;
}

std::string GenericHandler::toString(const Settings& settings) const {
    return renderFields(settings);
}

Expected<std::string> GenericHandler::generateConfig(const SettingsRequest& request) const {
    SettingNormalizer norm(handlerSpec.name, request.strict);
    Settings settings;

    // strict requests must name salt and rounds; relaxed ones get fresh/default values
    if (handlerSpec.salt) {
        auto salt = norm.normalizeSalt(request.salt, request.saltSize, *handlerSpec.salt);
        if (!salt) return salt.error();
        settings.salt = salt.value();
    }
    if (handlerSpec.rounds) {
        auto rounds = norm.normalizeRounds(request.rounds, *handlerSpec.rounds);
        if (!rounds) return rounds.error();
        settings.rounds = rounds.value();
        settings.roundsExplicit = !request.implicitRounds.value_or(true);
    }
    return toString(settings);
}

Expected<std::string> GenericHandler::generateHash(const std::string& secret, const std::string& config) const {
    auto parsed = fromString(config);
    if (!parsed) return parsed.error();
    Settings settings = parsed.value();
    settings.checksum = computeChecksum(secret, settings);
    return toString(settings);
}

Expected<std::string> GenericHandler::encrypt(const std::string& secret, const SettingsRequest& request) const {
    auto config = generateConfig(request);
    if (!config) return config.error();
    return generateHash(secret, config.value());
}

Expected<bool> GenericHandler::verify(const std::string& secret, const std::string& hash) const {
    auto parsed = fromString(hash);
    if (!parsed) return parsed.error();
    const Settings& settings = parsed.value();
    if (!settings.isHash()) {
        return Error{ErrorCode::InvalidHash, handlerSpec.name + ": expected a hash, got a config string"};
    }
    std::string computed = computeChecksum(secret, settings);
    const std::string& stored = *settings.checksum;
    if (computed.size() != stored.size()) return false;
    bool match = CRYPTO_memcmp(computed.data(), stored.data(), stored.size()) == 0;
    Logger& log = Logger::instance();
    if (log.enabled(LogLevel::Debug)) log.debug(handlerSpec.name + ": verify " + (match ? "matched" : "did not match"));
    return match;
}

}
