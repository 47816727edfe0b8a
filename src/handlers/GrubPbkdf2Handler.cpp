#include "handlers/GrubPbkdf2Handler.hpp"

#include "util/Digest.hpp"
#include "util/HexCodec.hpp"

namespace saltline {

namespace {

constexpr size_t CHECKSUM_SIZE = 64;

HandlerSpec buildSpec() {
    HandlerSpec spec;
    spec.name = "grub_pbkdf2_sha512";
    spec.idents = {"grub.pbkdf2.sha512."};
    spec.settingKwds = {SettingKwd::Salt, SettingKwd::SaltSize, SettingKwd::Rounds};
    spec.salt = SaltPolicy{SaltKind::Raw, 0, 64, 1024, "", ""};
    spec.rounds = RoundsPolicy{1, 10000, UINT32_MAX, RoundsCost::Linear, false};
    spec.checksum = ChecksumInfo{CHECKSUM_SIZE, CHECKSUM_SIZE * 2};
    spec.description = "PBKDF2-HMAC-SHA512 in GRUB2's format";
    return spec;
}

GrammarOptions buildGrammar() {
    GrammarOptions g;
    g.ident = "grub.pbkdf2.sha512.";
    g.sep = '.';
    g.roundsBase = 10;
    return g;
}

}

GrubPbkdf2Handler::GrubPbkdf2Handler() : GenericHandler(buildSpec()), grammar(buildGrammar()) {}

std::shared_ptr<const IHandler> GrubPbkdf2Handler::create() {
    return std::make_shared<GrubPbkdf2Handler>();
}

Expected<Settings> GrubPbkdf2Handler::parseFields(const std::string& hash) const {
    auto fields = grammar.parse(hash);
    if (!fields) return fields.error();
    const ParsedFields& f = fields.value();

    Settings s;
    s.rounds = f.rounds;
    s.roundsExplicit = true;
    auto salt = HexCodec::decode(f.salt);
    if (!salt) return Error{ErrorCode::InvalidHash, name() + ": bad salt: " + salt.error().message};
    s.salt = salt.value();
    if (f.checksum) {
        auto chk = HexCodec::decode(*f.checksum);
        if (!chk) return Error{ErrorCode::InvalidHash, name() + ": bad checksum: " + chk.error().message};
        s.checksum = chk.value();
    }
    return s;
}

std::string GrubPbkdf2Handler::renderFields(const Settings& settings) const {
    std::optional<std::string> chk;
    if (settings.checksum) chk = HexCodec::encode(*settings.checksum, true);
    return grammar.render(settings.rounds, true, HexCodec::encode(settings.salt, true), chk);
}

std::string GrubPbkdf2Handler::computeChecksum(const std::string& secret, const Settings& settings) const {
    return pbkdf2Hmac(secret, settings.salt, settings.rounds.value_or(10000), CHECKSUM_SIZE, "sha512");
}

}
