#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/HandlerSpec.hpp"
#include "util/Expected.hpp"

namespace saltline {

/**
 * @brief Enforces a handler's salt and rounds bounds
 *
 * Strict mode turns every violation into SettingOutOfRange. Relaxed mode
 * clamps or truncates where that is meaningful and logs a warning instead.
 * Two things are never corrected: a salt shorter than the minimum and a
 * salt character outside the charset.
 */
class SettingNormalizer {
public:
    SettingNormalizer(std::string handlerName, bool strict);

    bool strict() const { return strictMode; }

    /// Unset means the handler default, or an error when strict
    Expected<uint32_t> normalizeRounds(std::optional<uint32_t> requested, const RoundsPolicy& policy) const;

    /// Unset means the default size; out-of-range sizes clamp (relaxed) or fail (strict)
    Expected<size_t> normalizeSaltSize(std::optional<size_t> requested, const SaltPolicy& policy) const;

    /**
     * @brief Check a caller-supplied salt, or generate one when unset
     *
     * Sizes count bytes for raw salts and characters for character salts.
     * An unset salt is an error in strict mode.
     */
    Expected<std::string> normalizeSalt(const std::optional<std::string>& requested,
                                        std::optional<size_t> saltSize,
                                        const SaltPolicy& policy) const;

    /// Draw a fresh salt of normalizeSaltSize(saltSize) from the CSPRNG
    Expected<std::string> generateSalt(std::optional<size_t> saltSize, const SaltPolicy& policy) const;

private:
    std::string handler;
    bool strictMode;

    Error outOfRange(const std::string& what) const;
    void corrected(const std::string& what) const;
};

}
