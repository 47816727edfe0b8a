#include "core/HandlerSpec.hpp"

#include <algorithm>

namespace saltline {

namespace {
Error misconfigured(const std::string& name, const std::string& what) {
    return Error{ErrorCode::MisconfiguredHandler, (name.empty() ? std::string("<unnamed>") : name) + ": " + what};
}
}

bool HandlerSpec::acceptsSetting(const std::string& kwd) const {
    return std::find(settingKwds.begin(), settingKwds.end(), kwd) != settingKwds.end();
}

const char* roundsCostName(RoundsCost cost) {
    return cost == RoundsCost::Log2 ? "log2" : "linear";
}

void HandlerSpec::resolveDefaults() {
    if (salt && salt->kind == SaltKind::Chars && salt->defaultCharset.empty()) {
        salt->defaultCharset = salt->charset;
    }
}

Expected<void> HandlerSpec::validate() const {
    if (name.empty()) return misconfigured(name, "no name specified");
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok) return misconfigured(name, "name must be lowercase letters, digits and underscores");
    }
    if (idents.empty()) return misconfigured(name, "no ident specified");
    for (const auto& id : idents) {
        if (id.empty()) return misconfigured(name, "empty ident");
    }

    if (salt.has_value() != acceptsSetting(SettingKwd::Salt)) {
        return misconfigured(name, "salt policy and 'salt' setting keyword must come together");
    }
    if (acceptsSetting(SettingKwd::SaltSize) && !salt) {
        return misconfigured(name, "'salt_size' accepted without a salt policy");
    }
    if (rounds.has_value() != acceptsSetting(SettingKwd::Rounds)) {
        return misconfigured(name, "rounds policy and 'rounds' setting keyword must come together");
    }

    if (salt) {
        const SaltPolicy& s = *salt;
        if (s.minSize > s.maxSize) return misconfigured(name, "min salt size too large");
        if (s.defaultSize < s.minSize) return misconfigured(name, "default salt size too small");
        if (s.defaultSize > s.maxSize) return misconfigured(name, "default salt size too large");
        if (s.kind == SaltKind::Chars) {
            if (s.charset.empty()) return misconfigured(name, "character salt without a charset");
            if (s.defaultCharset.empty()) return misconfigured(name, "default salt charset not resolved");
            for (char c : s.defaultCharset) {
                if (s.charset.find(c) == std::string::npos) {
                    return misconfigured(name, "default salt charset not subset of salt charset");
                }
            }
        }
    }

    if (rounds) {
        const RoundsPolicy& r = *rounds;
        if (r.minRounds > r.maxRounds) return misconfigured(name, "min rounds too large");
        if (r.defaultRounds < r.minRounds) return misconfigured(name, "default rounds too small");
        if (r.defaultRounds > r.maxRounds) return misconfigured(name, "default rounds too large");
        if (r.cost == RoundsCost::Log2 && r.maxRounds > 63) {
            return misconfigured(name, "log2 rounds above 63 cannot be represented");
        }
    }
    return {};
}

}
