#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "util/Expected.hpp"

namespace saltline {

/**
 * @brief Layout of a delimited hash string
 *
 * Two rounds layouts are supported:
 *   positional (roundsPrefix empty): ident ROUNDS sep SALT [sep CHECKSUM]
 *       ROUNDS may be empty, meaning implicitRounds
 *   prefixed (roundsPrefix set):     ident [PREFIX ROUNDS sep] SALT [sep CHECKSUM]
 * With hasRounds false there is no rounds field at all.
 */
struct GrammarOptions {
    std::string ident;
    char sep{'$'};
    bool hasRounds{true};
    int roundsBase{10};                       // 10 or 16
    std::optional<uint32_t> implicitRounds;
    std::string roundsPrefix;
};

/// Raw field tokens split out of a hash string; nothing here is decoded
struct ParsedFields {
    std::optional<uint32_t> rounds;
    bool roundsExplicit{false};
    std::string salt;
    std::optional<std::string> checksum;      // absent or empty field -> config
};

class FieldGrammar {
public:
    explicit FieldGrammar(GrammarOptions options);

    /// Split a hash or config string; InvalidHash if it does not fit the layout
    Expected<ParsedFields> parse(const std::string& text) const;

    /**
     * @brief Exact inverse of parse
     *
     * Rounds equal to the implicit value and not explicit are left out:
     * an empty field in the positional layout, no field in the prefixed one.
     */
    std::string render(std::optional<uint32_t> rounds, bool roundsExplicit,
                       const std::string& salt, const std::optional<std::string>& checksum) const;

    const GrammarOptions& options() const { return opts; }

private:
    GrammarOptions opts;

    Expected<uint32_t> parseRounds(const std::string& token) const;
    std::string formatRounds(uint32_t rounds) const;
};

}
