#include "core/FieldGrammar.hpp"

#include <stdexcept>
#include <vector>

namespace saltline {

namespace {

std::vector<std::string> splitFields(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

int digitValue(char c, int base) {
    int v = -1;
    if (c >= '0' && c <= '9') v = c - '0';
    else if (c >= 'a' && c <= 'f') v = c - 'a' + 10;
    else if (c >= 'A' && c <= 'F') v = c - 'A' + 10;
    return v < base ? v : -1;
}

Error malformed(const std::string& ident, const std::string& what) {
    return Error{ErrorCode::InvalidHash, "malformed " + ident + " hash (" + what + ")"};
}

}

FieldGrammar::FieldGrammar(GrammarOptions options) : opts(std::move(options)) {
    if (opts.ident.empty()) {
        throw std::invalid_argument("FieldGrammar: ident must not be empty");
    }
    if (opts.roundsBase != 10 && opts.roundsBase != 16) {
        throw std::invalid_argument("FieldGrammar: rounds base must be 10 or 16");
    }
}

Expected<uint32_t> FieldGrammar::parseRounds(const std::string& token) const {
    if (token.size() > 1 && token[0] == '0') {
        return malformed(opts.ident, "zero-padded rounds");
    }
    uint64_t value = 0;
    for (char c : token) {
        int d = digitValue(c, opts.roundsBase);
        if (d < 0) return malformed(opts.ident, "invalid rounds");
        value = value * static_cast<uint64_t>(opts.roundsBase) + static_cast<uint64_t>(d);
        if (value > UINT32_MAX) return malformed(opts.ident, "rounds out of range");
    }
    return static_cast<uint32_t>(value);
}

std::string FieldGrammar::formatRounds(uint32_t rounds) const {
    if (opts.roundsBase == 10) return std::to_string(rounds);
    static const char* digits = "0123456789abcdef";
    std::string out;
    do {
        out.insert(out.begin(), digits[rounds & 0xF]);
        rounds >>= 4;
    } while (rounds != 0);
    return out;
}

Expected<ParsedFields> FieldGrammar::parse(const std::string& text) const {
    if (text.compare(0, opts.ident.size(), opts.ident) != 0) {
        return malformed(opts.ident, "wrong identifier");
    }
    std::vector<std::string> parts = splitFields(text.substr(opts.ident.size()), opts.sep);

    ParsedFields out;
    size_t next = 0;
    if (opts.hasRounds) {
        if (opts.roundsPrefix.empty()) {
            // positional: rounds field always present
            if (parts.size() < 2) return malformed(opts.ident, "not enough fields");
            const std::string& token = parts[next++];
            if (token.empty()) {
                if (!opts.implicitRounds) return malformed(opts.ident, "empty rounds field");
                out.rounds = opts.implicitRounds;
            } else {
                auto r = parseRounds(token);
                if (!r) return r.error();
                out.rounds = r.value();
                out.roundsExplicit = true;
            }
        } else if (parts.size() > 1 && parts[0].compare(0, opts.roundsPrefix.size(), opts.roundsPrefix) == 0) {
            std::string token = parts[next++].substr(opts.roundsPrefix.size());
            if (token.empty()) return malformed(opts.ident, "empty rounds field");
            auto r = parseRounds(token);
            if (!r) return r.error();
            out.rounds = r.value();
            out.roundsExplicit = true;
        } else {
            out.rounds = opts.implicitRounds;
        }
    }

    size_t remaining = parts.size() - next;
    if (remaining == 0) return malformed(opts.ident, "missing salt");
    if (remaining > 2) return malformed(opts.ident, "too many fields");
    out.salt = parts[next];
    if (remaining == 2 && !parts[next + 1].empty()) {
        out.checksum = parts[next + 1];
    }
    return out;
}

std::string FieldGrammar::render(std::optional<uint32_t> rounds, bool roundsExplicit,
                                 const std::string& salt, const std::optional<std::string>& checksum) const {
    std::string out = opts.ident;
    if (opts.hasRounds) {
        bool omit = !rounds || (!roundsExplicit && opts.implicitRounds && *rounds == *opts.implicitRounds);
        if (opts.roundsPrefix.empty()) {
            if (!omit) out += formatRounds(*rounds);
            out += opts.sep;
        } else if (!omit) {
            out += opts.roundsPrefix + formatRounds(*rounds) + opts.sep;
        }
    }
    out += salt;
    if (checksum) {
        out += opts.sep;
        out += *checksum;
    }
    return out;
}

}
