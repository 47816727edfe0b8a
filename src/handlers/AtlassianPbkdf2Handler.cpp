#include "handlers/AtlassianPbkdf2Handler.hpp"

#include "util/Digest.hpp"
#include "util/Hash64Codec.hpp"

namespace saltline {

namespace {

constexpr const char* IDENT = "{PKCS5S2}";
constexpr size_t SALT_SIZE = 16;
constexpr size_t CHECKSUM_SIZE = 32;

HandlerSpec buildSpec() {
    HandlerSpec spec;
    spec.name = "atlassian_pbkdf2_sha1";
    spec.idents = {IDENT};
    spec.settingKwds = {SettingKwd::Salt};
    spec.salt = SaltPolicy{SaltKind::Raw, SALT_SIZE, SALT_SIZE, SALT_SIZE, "", ""};
    spec.checksum = ChecksumInfo{CHECKSUM_SIZE, Hash64Codec::b64().encodedSize(SALT_SIZE + CHECKSUM_SIZE)};
    spec.description = "PBKDF2-HMAC-SHA1, 10000 rounds, Atlassian format";
    return spec;
}

}

AtlassianPbkdf2Handler::AtlassianPbkdf2Handler() : GenericHandler(buildSpec()) {}

std::shared_ptr<const IHandler> AtlassianPbkdf2Handler::create() {
    return std::make_shared<AtlassianPbkdf2Handler>();
}

Expected<Settings> AtlassianPbkdf2Handler::parseFields(const std::string& hash) const {
    std::string body = hash.substr(std::string(IDENT).size());
    auto raw = Hash64Codec::b64().decodeBytes(body);
    if (!raw) return Error{ErrorCode::InvalidHash, name() + ": bad base64: " + raw.error().message};
    if (raw.value().size() != SALT_SIZE + CHECKSUM_SIZE) {
        return Error{ErrorCode::InvalidHash, name() + ": wrong decoded size"};
    }
    Settings s;
    s.salt = raw.value().substr(0, SALT_SIZE);
    s.checksum = raw.value().substr(SALT_SIZE);
    return s;
}

std::string AtlassianPbkdf2Handler::renderFields(const Settings& settings) const {
    std::string chk = settings.checksum ? *settings.checksum : std::string(CHECKSUM_SIZE, '\0');
    return IDENT + Hash64Codec::b64().encodeBytes(settings.salt + chk);
}

std::string AtlassianPbkdf2Handler::computeChecksum(const std::string& secret, const Settings& settings) const {
    return pbkdf2Hmac(secret, settings.salt, ROUNDS, CHECKSUM_SIZE, "sha1");
}

}
