#include "core/SettingNormalizer.hpp"

#include "util/Logger.hpp"
#include "util/Random.hpp"

namespace saltline {

SettingNormalizer::SettingNormalizer(std::string handlerName, bool strict)
    : handler(std::move(handlerName)), strictMode(strict) {}

Error SettingNormalizer::outOfRange(const std::string& what) const {
    return Error{ErrorCode::SettingOutOfRange, handler + ": " + what};
}

void SettingNormalizer::corrected(const std::string& what) const {
    Logger::instance().warn(handler + ": " + what);
}

Expected<uint32_t> SettingNormalizer::normalizeRounds(std::optional<uint32_t> requested, const RoundsPolicy& policy) const {
    if (!requested) {
        if (strictMode) return outOfRange("rounds required");
        return policy.defaultRounds;
    }
    uint32_t rounds = *requested;
    if (rounds < policy.minRounds) {
        std::string msg = "rounds too low (min_rounds is " + std::to_string(policy.minRounds) + ")";
        if (strictMode || policy.strictBounds) return outOfRange(msg);
        corrected(msg + ", using " + std::to_string(policy.minRounds));
        rounds = policy.minRounds;
    }
    if (rounds > policy.maxRounds) {
        std::string msg = "rounds too high (max_rounds is " + std::to_string(policy.maxRounds) + ")";
        if (strictMode) return outOfRange(msg);
        corrected(msg + ", using " + std::to_string(policy.maxRounds));
        rounds = policy.maxRounds;
    }
    return rounds;
}

Expected<size_t> SettingNormalizer::normalizeSaltSize(std::optional<size_t> requested, const SaltPolicy& policy) const {
    if (!requested) return policy.defaultSize;
    size_t size = *requested;
    if (size < policy.minSize) {
        std::string msg = "salt_size too small (min is " + std::to_string(policy.minSize) + ")";
        if (strictMode) return outOfRange(msg);
        corrected(msg + ", using " + std::to_string(policy.minSize));
        size = policy.minSize;
    }
    if (size > policy.maxSize) {
        std::string msg = "salt_size too large (max is " + std::to_string(policy.maxSize) + ")";
        if (strictMode) return outOfRange(msg);
        corrected(msg + ", using " + std::to_string(policy.maxSize));
        size = policy.maxSize;
    }
    return size;
}

Expected<std::string> SettingNormalizer::generateSalt(std::optional<size_t> saltSize, const SaltPolicy& policy) const {
    auto size = normalizeSaltSize(saltSize, policy);
    if (!size) return size.error();
    if (policy.kind == SaltKind::Raw) {
        return Random::randomBytes(size.value());
    }
    const std::string& charset = policy.defaultCharset.empty() ? policy.charset : policy.defaultCharset;
    return Random::randomString(charset, size.value());
}

Expected<std::string> SettingNormalizer::normalizeSalt(const std::optional<std::string>& requested,
                                                       std::optional<size_t> saltSize,
                                                       const SaltPolicy& policy) const {
    if (!requested) {
        if (strictMode) return outOfRange("salt required");
        return generateSalt(saltSize, policy);
    }
    std::string salt = *requested;

    if (policy.kind == SaltKind::Chars) {
        for (char c : salt) {
            if (policy.charset.find(c) == std::string::npos) {
                return outOfRange(std::string("invalid character in salt: '") + c + "'");
            }
        }
    }
    const char* unit = policy.kind == SaltKind::Raw ? " bytes" : " chars";
    if (salt.size() < policy.minSize) {
        return outOfRange("salt too small (requires at least " + std::to_string(policy.minSize) + unit + ")");
    }
    if (salt.size() > policy.maxSize) {
        std::string msg = "salt too large (allows at most " + std::to_string(policy.maxSize) + unit + ")";
        if (strictMode) return outOfRange(msg);
        corrected(msg + ", truncating");
        salt.resize(policy.maxSize);
    }
    return salt;
}

}
