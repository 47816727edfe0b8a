#include "handlers/DlitzPbkdf2Handler.hpp"

#include "util/Digest.hpp"
#include "util/Hash64Codec.hpp"

namespace saltline {

namespace {

constexpr size_t CHECKSUM_SIZE = 24;

HandlerSpec buildSpec() {
    HandlerSpec spec;
    spec.name = "dlitz_pbkdf2_sha1";
    spec.idents = {"$p5k2$"};
    spec.settingKwds = {SettingKwd::Salt, SettingKwd::SaltSize, SettingKwd::Rounds};
    spec.salt = SaltPolicy{SaltKind::Chars, 0, 16, 1024, HASH64_CHARS, ""};
    spec.rounds = RoundsPolicy{1, 10000, UINT32_MAX, RoundsCost::Linear, false};
    spec.checksum = ChecksumInfo{CHECKSUM_SIZE, Hash64Codec::ab64().encodedSize(CHECKSUM_SIZE)};
    spec.description = "PBKDF2-HMAC-SHA1 in Dwayne Litzenberger's format";
    return spec;
}

GrammarOptions buildGrammar() {
    GrammarOptions g;
    g.ident = "$p5k2$";
    g.roundsBase = 16;
    g.implicitRounds = DlitzPbkdf2Handler::IMPLICIT_ROUNDS;
    return g;
}

}

DlitzPbkdf2Handler::DlitzPbkdf2Handler() : GenericHandler(buildSpec()), grammar(buildGrammar()) {}

std::shared_ptr<const IHandler> DlitzPbkdf2Handler::create() {
    return std::make_shared<DlitzPbkdf2Handler>();
}

Expected<Settings> DlitzPbkdf2Handler::parseFields(const std::string& hash) const {
    auto fields = grammar.parse(hash);
    if (!fields) return fields.error();
    const ParsedFields& f = fields.value();

    Settings s;
    s.rounds = f.rounds;
    s.roundsExplicit = false;
    s.salt = f.salt;
    if (f.checksum) {
        if (f.checksum->size() != spec().checksum.encodedSize) {
            return Error{ErrorCode::InvalidHash, name() + ": checksum has wrong length"};
        }
        auto chk = Hash64Codec::ab64().decodeBytes(*f.checksum);
        if (!chk) return Error{ErrorCode::InvalidHash, name() + ": bad checksum encoding: " + chk.error().message};
        s.checksum = chk.value();
    }
    return s;
}

std::string DlitzPbkdf2Handler::renderFields(const Settings& settings) const {
    std::optional<std::string> chk;
    if (settings.checksum) chk = Hash64Codec::ab64().encodeBytes(*settings.checksum);
    // explicitness is ignored: 400 is never written out
    return grammar.render(settings.rounds, false, settings.salt, chk);
}

std::string DlitzPbkdf2Handler::computeChecksum(const std::string& secret, const Settings& settings) const {
    Settings config = settings;
    config.checksum.reset();
    return pbkdf2Hmac(secret, renderFields(config), settings.rounds.value_or(IMPLICIT_ROUNDS),
                      CHECKSUM_SIZE, "sha1");
}

}
