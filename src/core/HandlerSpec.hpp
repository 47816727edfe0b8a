#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace saltline {

/// Setting keywords a handler may accept
namespace SettingKwd {
    constexpr const char* Salt = "salt";
    constexpr const char* SaltSize = "salt_size";
    constexpr const char* Rounds = "rounds";
}

/// The crypt(3) hash64 alphabet, also the default charset for character salts
constexpr const char* HASH64_CHARS =
    "./0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

enum class SaltKind {
    Raw,     // arbitrary bytes, encoded by the handler when rendered
    Chars    // printable characters from a restricted charset, rendered verbatim
};

/**
 * @brief Salt capability of a handler
 *
 * Sizes count bytes for Raw salts and characters for Chars salts.
 */
struct SaltPolicy {
    SaltKind kind{SaltKind::Raw};
    size_t minSize{0};
    size_t defaultSize{16};
    size_t maxSize{1024};
    std::string charset;          // Chars only: every salt character must be in here
    std::string defaultCharset;   // Chars only: characters used when generating; empty means charset
};

enum class RoundsCost { Linear, Log2 };

/// Rounds capability of a handler
struct RoundsPolicy {
    uint32_t minRounds{1};
    uint32_t defaultRounds{1};
    uint32_t maxRounds{UINT32_MAX};
    RoundsCost cost{RoundsCost::Linear};
    bool strictBounds{false};     // below-minimum is an error even in relaxed mode
};

/// Checksum shape, used to reject hashes with a truncated or overlong checksum
struct ChecksumInfo {
    size_t size{0};            // decoded bytes
    size_t encodedSize{0};     // characters in the hash string
};

/**
 * @brief Static description of a hash scheme
 *
 * Built once per handler and never modified afterwards. Capabilities are
 * composed: a handler without salt has no SaltPolicy, one without a cost
 * parameter has no RoundsPolicy.
 */
struct HandlerSpec {
    std::string name;
    std::vector<std::string> idents;          // literal prefixes, first one is used when rendering
    std::vector<std::string> settingKwds;
    std::vector<std::string> contextKwds;
    std::optional<SaltPolicy> salt;
    std::optional<RoundsPolicy> rounds;
    ChecksumInfo checksum;
    std::string description;

    bool acceptsSetting(const std::string& kwd) const;

    /// Fill computed defaults into stored fields (default salt charset)
    void resolveDefaults();

    /// Check every invariant; MisconfiguredHandler on failure
    Expected<void> validate() const;
};

const char* roundsCostName(RoundsCost cost);

}
