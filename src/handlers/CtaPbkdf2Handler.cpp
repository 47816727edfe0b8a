#include "handlers/CtaPbkdf2Handler.hpp"

#include "util/Digest.hpp"
#include "util/Hash64Codec.hpp"

namespace saltline {

namespace {

constexpr size_t CHECKSUM_SIZE = 20;

HandlerSpec buildSpec() {
    HandlerSpec spec;
    spec.name = "cta_pbkdf2_sha1";
    spec.idents = {"$p5k2$"};
    spec.settingKwds = {SettingKwd::Salt, SettingKwd::SaltSize, SettingKwd::Rounds};
    spec.salt = SaltPolicy{SaltKind::Raw, 0, 16, 1024, "", ""};
    spec.rounds = RoundsPolicy{1, 10000, UINT32_MAX, RoundsCost::Linear, false};
    spec.checksum = ChecksumInfo{CHECKSUM_SIZE, Hash64Codec::ctaB64().encodedSize(CHECKSUM_SIZE)};
    spec.description = "PBKDF2-HMAC-SHA1 in Cryptacular's format";
    return spec;
}

GrammarOptions buildGrammar() {
    GrammarOptions g;
    g.ident = "$p5k2$";
    g.roundsBase = 16;
    return g;
}

}

CtaPbkdf2Handler::CtaPbkdf2Handler() : GenericHandler(buildSpec()), grammar(buildGrammar()) {}

std::shared_ptr<const IHandler> CtaPbkdf2Handler::create() {
    return std::make_shared<CtaPbkdf2Handler>();
}

Expected<Settings> CtaPbkdf2Handler::parseFields(const std::string& hash) const {
    auto fields = grammar.parse(hash);
    if (!fields) return fields.error();
    const ParsedFields& f = fields.value();

    Settings s;
    s.rounds = f.rounds;
    s.roundsExplicit = true;
    auto salt = Hash64Codec::ctaB64().decodeBytes(f.salt);
    if (!salt) return Error{ErrorCode::InvalidHash, name() + ": bad salt encoding: " + salt.error().message};
    s.salt = salt.value();
    if (f.checksum) {
        // the ab64 checksum of the dlitz variant shares this ident, reject it by shape
        if (f.checksum->size() != spec().checksum.encodedSize) {
            return Error{ErrorCode::InvalidHash, name() + ": checksum has wrong length"};
        }
        auto chk = Hash64Codec::ctaB64().decodeBytes(*f.checksum);
        if (!chk) return Error{ErrorCode::InvalidHash, name() + ": bad checksum encoding: " + chk.error().message};
        s.checksum = chk.value();
    }
    return s;
}

std::string CtaPbkdf2Handler::renderFields(const Settings& settings) const {
    std::optional<std::string> chk;
    if (settings.checksum) chk = Hash64Codec::ctaB64().encodeBytes(*settings.checksum);
    return grammar.render(settings.rounds, true, Hash64Codec::ctaB64().encodeBytes(settings.salt), chk);
}

std::string CtaPbkdf2Handler::computeChecksum(const std::string& secret, const Settings& settings) const {
    return pbkdf2Hmac(secret, settings.salt, settings.rounds.value_or(10000), CHECKSUM_SIZE, "sha1");
}

}
