#include "handlers/Sha512CryptHandler.hpp"

#include <stdexcept>
#include <vector>

#include "util/Digest.hpp"
#include "util/Hash64Codec.hpp"

namespace saltline {

namespace {

constexpr size_t CHECKSUM_SIZE = 64;

// byte order of the final digest in the encoded checksum
const std::vector<size_t>& transposeOffsets() {
    static const std::vector<size_t> offsets = {
        42, 21, 0,  1,  43, 22, 23, 2,  44, 45, 24, 3,  4,  46, 25, 26,
        5,  47, 48, 27, 6,  7,  49, 28, 29, 8,  50, 51, 30, 9,  10, 52,
        31, 32, 11, 53, 54, 33, 12, 13, 55, 34, 35, 14, 56, 57, 36, 15,
        16, 58, 37, 38, 17, 59, 60, 39, 18, 19, 61, 40, 41, 20, 62, 63,
    };
    return offsets;
}

HandlerSpec buildSpec() {
    HandlerSpec spec;
    spec.name = "sha512_crypt";
    spec.idents = {"$6$"};
    spec.settingKwds = {SettingKwd::Salt, SettingKwd::SaltSize, SettingKwd::Rounds};
    spec.salt = SaltPolicy{SaltKind::Chars, 0, 16, 16, HASH64_CHARS, ""};
    spec.rounds = RoundsPolicy{1000, 40000, 999999999, RoundsCost::Linear, false};
    spec.checksum = ChecksumInfo{CHECKSUM_SIZE, Hash64Codec::h64().encodedSize(CHECKSUM_SIZE)};
    spec.description = "SHA-512-crypt (glibc $6$)";
    return spec;
}

GrammarOptions buildGrammar() {
    GrammarOptions g;
    g.ident = "$6$";
    g.roundsBase = 10;
    g.implicitRounds = Sha512CryptHandler::IMPLICIT_ROUNDS;
    g.roundsPrefix = "rounds=";
    return g;
}

/// data repeated (or cut) to exactly len bytes
std::string repeatTo(const std::string& data, size_t len) {
    std::string out;
    out.reserve(len);
    while (out.size() + data.size() <= len) out += data;
    out.append(data, 0, len - out.size());
    return out;
}

}

Sha512CryptHandler::Sha512CryptHandler() : GenericHandler(buildSpec()), grammar(buildGrammar()) {}

std::shared_ptr<const IHandler> Sha512CryptHandler::create() {
    return std::make_shared<Sha512CryptHandler>();
}

Expected<Settings> Sha512CryptHandler::parseFields(const std::string& hash) const {
    auto fields = grammar.parse(hash);
    if (!fields) return fields.error();
    const ParsedFields& f = fields.value();

    Settings s;
    s.rounds = f.rounds;
    s.roundsExplicit = f.roundsExplicit;
    s.salt = f.salt;
    if (f.checksum) {
        auto chk = Hash64Codec::h64().decodeTransposedBytes(*f.checksum, transposeOffsets());
        if (!chk) return Error{ErrorCode::InvalidHash, name() + ": bad checksum encoding: " + chk.error().message};
        s.checksum = chk.value();
    }
    return s;
}

std::string Sha512CryptHandler::renderFields(const Settings& settings) const {
    std::optional<std::string> chk;
    if (settings.checksum) chk = Hash64Codec::h64().encodeTransposedBytes(*settings.checksum, transposeOffsets());
    return grammar.render(settings.rounds, settings.roundsExplicit, settings.salt, chk);
}

std::string Sha512CryptHandler::computeChecksum(const std::string& secret, const Settings& settings) const {
    auto md = DigestFactory::create("sha512");
    if (!md) {
        throw std::runtime_error("sha512 digest unavailable");
    }
    const std::string& pw = secret;
    const std::string& salt = settings.salt;
    const uint32_t rounds = settings.rounds.value_or(IMPLICIT_ROUNDS);
    const size_t pwLen = pw.size();

    // digest B = H(pw salt pw)
    md->update(pw);
    md->update(salt);
    md->update(pw);
    std::string b = md->digest();

    // digest A = H(pw salt B... bits-of-len(pw))
    md->update(pw);
    md->update(salt);
    md->update(repeatTo(b, pwLen));
    for (size_t n = pwLen; n > 0; n >>= 1) {
        md->update((n & 1) ? b : pw);
    }
    std::string a = md->digest();

    // P sequence
    for (size_t i = 0; i < pwLen; ++i) md->update(pw);
    std::string p = repeatTo(md->digest(), pwLen);

    // S sequence
    size_t saltReps = 16 + static_cast<unsigned char>(a[0]);
    for (size_t i = 0; i < saltReps; ++i) md->update(salt);
    std::string s = repeatTo(md->digest(), salt.size());

    std::string c = a;
    for (uint32_t i = 0; i < rounds; ++i) {
        md->update((i & 1) ? p : c);
        if (i % 3) md->update(s);
        if (i % 7) md->update(p);
        md->update((i & 1) ? c : p);
        c = md->digest();
    }
    return c;
}

}
