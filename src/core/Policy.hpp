#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"
#include "util/IniFile.hpp"

namespace saltline {

class IHandler;
class HandlerRegistry;
class PolicySource;

/// Option names accepted after "<scope>." or "<scope>__"
namespace PolicyOption {
    constexpr const char* SaltSize = "salt_size";
    constexpr const char* Rounds = "rounds";
    constexpr const char* MinRounds = "min_rounds";
    constexpr const char* MaxRounds = "max_rounds";
    constexpr const char* DefaultRounds = "default_rounds";
    constexpr const char* VaryRounds = "vary_rounds";
}

/// Ini section holding a policy
constexpr const char* POLICY_SECTION = "saltline";

/// Jitter applied to default rounds: a percentage of them or an absolute count
struct VaryRounds {
    uint32_t amount{0};
    bool percent{false};
};

/// Effective options for one scheme after precedence is applied
struct HandlerOptions {
    std::optional<size_t> saltSize;
    std::optional<uint32_t> rounds;
    std::optional<uint32_t> minRounds;
    std::optional<uint32_t> maxRounds;
    std::optional<uint32_t> defaultRounds;
    std::optional<VaryRounds> varyRounds;
};

/// Policy with scheme names replaced by live handlers
struct ResolvedPolicy {
    std::vector<std::shared_ptr<const IHandler>> handlers;       // in schemes order
    std::shared_ptr<const IHandler> defaultHandler;              // null when there are no schemes
    std::vector<std::shared_ptr<const IHandler>> deprecatedHandlers;
};

/**
 * @brief Immutable layered hashing policy
 *
 * Holds the ordered scheme list, the default scheme, the deprecated
 * schemes and option values keyed by (scope, option), where scope is
 * "all", a category name or a scheme name.
 *
 * Input keys: "schemes", "default", "deprecated", "<scope>.<option>" and
 * "<scope>__<option>". Values are validated when the policy is built and
 * stored in canonical text form, so two equivalent policies produce the
 * same toDict().
 */
class Policy {
public:
    using OptionKey = std::pair<std::string, std::string>;   // (scope, option)

    Policy() = default;

    static Expected<Policy> fromMap(const IniFile::KeyValues& values);
    static Expected<Policy> fromString(const std::string& iniText, const std::string& section = POLICY_SECTION);
    static Expected<Policy> fromPath(const std::filesystem::path& path, const std::string& section = POLICY_SECTION);
    static Expected<Policy> fromSource(const PolicySource& source);

    /// Left fold of replace() over every source; InvalidArgs on an empty list
    static Expected<Policy> fromSources(const std::vector<PolicySource>& sources);

    /// New policy: this one overlaid by overlay, key by key
    Policy replace(const Policy& overlay) const;

    /// Options for scheme with precedence scheme > category > all
    HandlerOptions getOptions(const std::string& scheme, const std::optional<std::string>& category = std::nullopt) const;

    bool hasSchemes() const { return schemeList.has_value(); }
    std::vector<std::string> schemes() const;
    const std::optional<std::string>& defaultScheme() const { return defaultName; }
    std::vector<std::string> deprecated() const;
    bool handlerIsDeprecated(const std::string& scheme) const;

    /// Canonical key -> value mapping, lists joined by ", "
    IniFile::KeyValues toDict() const;

    /// Ini text under [saltline]
    std::string toString() const;

    /// UnknownScheme if any named scheme is not in registry
    Expected<ResolvedPolicy> resolved(const HandlerRegistry& registry) const;

    bool operator==(const Policy& other) const;
    bool operator!=(const Policy& other) const { return !(*this == other); }

private:
    std::optional<std::vector<std::string>> schemeList;
    std::optional<std::string> defaultName;
    std::optional<std::vector<std::string>> deprecatedList;
    std::map<OptionKey, std::string> options;
};

/**
 * @brief One input to Policy::fromSources
 *
 * A key/value map, ini text, an ini file path or an existing policy.
 */
class PolicySource {
public:
    enum class Kind { Map, Text, Path, Existing };

    static PolicySource fromMap(IniFile::KeyValues values);
    static PolicySource fromText(std::string iniText);
    static PolicySource fromPath(std::filesystem::path path);
    static PolicySource fromPolicy(Policy policy);

    Kind kind() const { return sourceKind; }
    const IniFile::KeyValues& values() const { return map; }
    const std::string& text() const { return ini; }
    const std::filesystem::path& path() const { return file; }
    const Policy& policy() const { return existing; }

private:
    Kind sourceKind{Kind::Map};
    IniFile::KeyValues map;
    std::string ini;
    std::filesystem::path file;
    Policy existing;
};

/// Parse "10%" or "250"; InvalidPolicy on anything else
Expected<VaryRounds> parseVaryRounds(const std::string& text);

}
