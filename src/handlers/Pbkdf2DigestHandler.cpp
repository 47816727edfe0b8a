#include "handlers/Pbkdf2DigestHandler.hpp"

#include <stdexcept>

#include "util/Digest.hpp"
#include "util/Hash64Codec.hpp"

namespace saltline {

namespace {

HandlerSpec buildSpec(const Pbkdf2Variant& v) {
    HandlerSpec spec;
    spec.name = v.name;
    spec.idents = {v.ident};
    spec.settingKwds = {SettingKwd::Salt, SettingKwd::SaltSize, SettingKwd::Rounds};
    spec.salt = SaltPolicy{SaltKind::Raw, 0, 16, 1024, "", ""};
    spec.rounds = RoundsPolicy{1, Pbkdf2DigestHandler::DEFAULT_ROUNDS, UINT32_MAX, RoundsCost::Linear, false};
    spec.checksum = ChecksumInfo{v.checksumSize, Hash64Codec::ab64().encodedSize(v.checksumSize)};
    spec.description = "PBKDF2-HMAC-" + v.digest + ", adapted base64";
    return spec;
}

GrammarOptions buildGrammar(const Pbkdf2Variant& v) {
    GrammarOptions g;
    g.ident = v.ident;
    g.roundsBase = 10;
    return g;
}

}

Pbkdf2Variant makePbkdf2Variant(const std::string& digest) {
    if (digest == "sha1") return Pbkdf2Variant{"pbkdf2_sha1", "sha1", 20, "$pbkdf2$"};
    if (digest == "sha256") return Pbkdf2Variant{"pbkdf2_sha256", "sha256", 32, "$pbkdf2-sha256$"};
    if (digest == "sha512") return Pbkdf2Variant{"pbkdf2_sha512", "sha512", 64, "$pbkdf2-sha512$"};
    throw std::invalid_argument("no pbkdf2 variant for digest " + digest);
}

Pbkdf2DigestHandler::Pbkdf2DigestHandler(Pbkdf2Variant variant)
    : GenericHandler(buildSpec(variant)), pbkdf2(variant), grammar(buildGrammar(variant)) {}

std::shared_ptr<const IHandler> Pbkdf2DigestHandler::create(const std::string& digest) {
    return std::make_shared<Pbkdf2DigestHandler>(makePbkdf2Variant(digest));
}

Expected<Settings> Pbkdf2DigestHandler::parseFields(const std::string& hash) const {
    auto fields = grammar.parse(hash);
    if (!fields) return fields.error();
    const ParsedFields& f = fields.value();

    Settings s;
    s.rounds = f.rounds;
    s.roundsExplicit = f.roundsExplicit;
    auto salt = Hash64Codec::ab64().decodeBytes(f.salt);
    if (!salt) return Error{ErrorCode::InvalidHash, name() + ": bad salt encoding: " + salt.error().message};
    s.salt = salt.value();
    if (f.checksum) {
        auto chk = Hash64Codec::ab64().decodeBytes(*f.checksum);
        if (!chk) return Error{ErrorCode::InvalidHash, name() + ": bad checksum encoding: " + chk.error().message};
        s.checksum = chk.value();
    }
    return s;
}

std::string Pbkdf2DigestHandler::renderFields(const Settings& settings) const {
    std::optional<std::string> chk;
    if (settings.checksum) chk = Hash64Codec::ab64().encodeBytes(*settings.checksum);
    return grammar.render(settings.rounds, true, Hash64Codec::ab64().encodeBytes(settings.salt), chk);
}

std::string Pbkdf2DigestHandler::computeChecksum(const std::string& secret, const Settings& settings) const {
    return pbkdf2Hmac(secret, settings.salt, settings.rounds.value_or(DEFAULT_ROUNDS),
                      pbkdf2.checksumSize, pbkdf2.digest);
}

}
