#include "core/Policy.hpp"

#include <algorithm>
#include <cctype>

#include "core/HandlerRegistry.hpp"
#include "util/Logger.hpp"

namespace saltline {

namespace {

const std::vector<std::string>& knownOptions() {
    static const std::vector<std::string> names = {
        PolicyOption::SaltSize, PolicyOption::Rounds, PolicyOption::MinRounds,
        PolicyOption::MaxRounds, PolicyOption::DefaultRounds, PolicyOption::VaryRounds,
    };
    return names;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

Error invalid(const std::string& what) {
    return Error{ErrorCode::InvalidPolicy, what};
}

bool validName(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
    }
    return true;
}

/// Comma and/or whitespace separated names
std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += items[i];
    }
    return out;
}

Expected<std::vector<std::string>> parseNameList(const std::string& key, const std::string& text) {
    std::vector<std::string> names = splitList(text);
    for (size_t i = 0; i < names.size(); ++i) {
        if (!validName(names[i])) return invalid(key + ": invalid scheme name '" + names[i] + "'");
        if (std::find(names.begin(), names.begin() + static_cast<std::ptrdiff_t>(i), names[i]) != names.begin() + static_cast<std::ptrdiff_t>(i)) {
            return invalid(key + ": duplicate scheme '" + names[i] + "'");
        }
    }
    return names;
}

Expected<uint32_t> parseUint32(const std::string& key, const std::string& text) {
    if (text.empty()) return invalid(key + ": value required");
    uint64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return invalid(key + ": expected an integer, got '" + text + "'");
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > UINT32_MAX) return invalid(key + ": value out of range");
    }
    return static_cast<uint32_t>(v);
}

Expected<std::string> canonicalValue(const std::string& key, const std::string& option, const std::string& text) {
    if (option == PolicyOption::VaryRounds) {
        auto vary = parseVaryRounds(text);
        if (!vary) return invalid(key + ": " + vary.error().message);
        return std::to_string(vary.value().amount) + (vary.value().percent ? "%" : "");
    }
    auto v = parseUint32(key, text);
    if (!v) return v.error();
    return std::to_string(v.value());
}

}

Expected<VaryRounds> parseVaryRounds(const std::string& text) {
    std::string t = trim(text);
    VaryRounds out;
    if (!t.empty() && t.back() == '%') {
        out.percent = true;
        t = trim(t.substr(0, t.size() - 1));
    }
    auto v = parseUint32("vary_rounds", t);
    if (!v) return invalid("vary_rounds must be a count or a percentage, got '" + text + "'");
    out.amount = v.value();
    if (out.percent && out.amount > 100) return invalid("vary_rounds percentage above 100%");
    return out;
}

Expected<Policy> Policy::fromMap(const IniFile::KeyValues& values) {
    Policy p;
    for (const auto& [rawKey, rawValue] : values) {
        std::string key = trim(rawKey);
        std::string value = trim(rawValue);

        if (key == "schemes" || key == "deprecated") {
            auto names = parseNameList(key, value);
            if (!names) return names.error();
            (key == "schemes" ? p.schemeList : p.deprecatedList) = names.value();
            continue;
        }
        if (key == "default") {
            if (!validName(value)) return invalid("default: invalid scheme name '" + value + "'");
            p.defaultName = value;
            continue;
        }

        std::string scope;
        std::string option;
        size_t dot = key.find('.');
        size_t under = key.rfind("__");
        if (dot != std::string::npos) {
            scope = key.substr(0, dot);
            option = key.substr(dot + 1);
        } else if (under != std::string::npos) {
            scope = key.substr(0, under);
            option = key.substr(under + 2);
        } else {
            return invalid("unknown policy key '" + key + "'");
        }
        if (!validName(scope)) return invalid("invalid scope in key '" + key + "'");
        const auto& known = knownOptions();
        if (std::find(known.begin(), known.end(), option) == known.end()) {
            return invalid("unknown policy option '" + option + "' in key '" + key + "'");
        }
        auto canonical = canonicalValue(key, option, value);
        if (!canonical) return canonical.error();
        p.options[OptionKey{scope, option}] = canonical.value();
    }
    return p;
}

Expected<Policy> Policy::fromString(const std::string& iniText, const std::string& section) {
    auto values = IniFile::readSection(iniText, section);
    if (!values) return values.error();
    return fromMap(values.value());
}

Expected<Policy> Policy::fromPath(const std::filesystem::path& path, const std::string& section) {
    auto text = IniFile::readFile(path);
    if (!text) return text.error();
    auto policy = fromString(text.value(), section);
    if (!policy) {
        return Error{policy.error().code, path.string() + ": " + policy.error().message};
    }
    Logger::instance().info("loaded policy from " + path.string());
    return policy;
}

Expected<Policy> Policy::fromSource(const PolicySource& source) {
    switch (source.kind()) {
        case PolicySource::Kind::Map: return fromMap(source.values());
        case PolicySource::Kind::Text: return fromString(source.text());
        case PolicySource::Kind::Path: return fromPath(source.path());
        case PolicySource::Kind::Existing: return source.policy();
    }
    return Error{ErrorCode::InternalError, "unhandled policy source kind"};
}

Expected<Policy> Policy::fromSources(const std::vector<PolicySource>& sources) {
    if (sources.empty()) {
        return Error{ErrorCode::InvalidArgs, "no policy sources given"};
    }
    Policy merged;
    for (const auto& source : sources) {
        auto next = fromSource(source);
        if (!next) return next.error();
        merged = merged.replace(next.value());
    }
    return merged;
}

Policy Policy::replace(const Policy& overlay) const {
    Policy out = *this;
    if (overlay.schemeList) out.schemeList = overlay.schemeList;
    if (overlay.defaultName) out.defaultName = overlay.defaultName;
    if (overlay.deprecatedList) out.deprecatedList = overlay.deprecatedList;
    for (const auto& kv : overlay.options) {
        out.options[kv.first] = kv.second;
    }
    return out;
}

HandlerOptions Policy::getOptions(const std::string& scheme, const std::optional<std::string>& category) const {
    auto lookup = [&](const char* option) -> const std::string* {
        auto it = options.find(OptionKey{scheme, option});
        if (it != options.end()) return &it->second;
        if (category) {
            it = options.find(OptionKey{*category, option});
            if (it != options.end()) return &it->second;
        }
        it = options.find(OptionKey{"all", option});
        if (it != options.end()) return &it->second;
        return nullptr;
    };
    // stored values were validated on construction
    auto asUint = [](const std::string& text) { return static_cast<uint32_t>(std::stoul(text)); };

    HandlerOptions out;
    if (auto v = lookup(PolicyOption::SaltSize)) out.saltSize = asUint(*v);
    if (auto v = lookup(PolicyOption::Rounds)) out.rounds = asUint(*v);
    if (auto v = lookup(PolicyOption::MinRounds)) out.minRounds = asUint(*v);
    if (auto v = lookup(PolicyOption::MaxRounds)) out.maxRounds = asUint(*v);
    if (auto v = lookup(PolicyOption::DefaultRounds)) out.defaultRounds = asUint(*v);
    if (auto v = lookup(PolicyOption::VaryRounds)) {
        auto vary = parseVaryRounds(*v);
        if (vary) out.varyRounds = vary.value();
    }
    return out;
}

std::vector<std::string> Policy::schemes() const {
    return schemeList ? *schemeList : std::vector<std::string>{};
}

std::vector<std::string> Policy::deprecated() const {
    return deprecatedList ? *deprecatedList : std::vector<std::string>{};
}

bool Policy::handlerIsDeprecated(const std::string& scheme) const {
    if (!deprecatedList) return false;
    return std::find(deprecatedList->begin(), deprecatedList->end(), scheme) != deprecatedList->end();
}

IniFile::KeyValues Policy::toDict() const {
    IniFile::KeyValues out;
    if (schemeList) out.emplace_back("schemes", joinList(*schemeList));
    if (defaultName) out.emplace_back("default", *defaultName);
    if (deprecatedList) out.emplace_back("deprecated", joinList(*deprecatedList));
    for (const auto& [key, value] : options) {
        out.emplace_back(key.first + "." + key.second, value);
    }
    return out;
}

std::string Policy::toString() const {
    return IniFile::writeSection(POLICY_SECTION, toDict());
}

Expected<ResolvedPolicy> Policy::resolved(const HandlerRegistry& registry) const {
    ResolvedPolicy out;
    for (const auto& name : schemes()) {
        auto handler = registry.find(name);
        if (!handler) return handler.error();
        out.handlers.push_back(handler.value());
    }
    if (defaultName) {
        auto handler = registry.find(*defaultName);
        if (!handler) return handler.error();
        out.defaultHandler = handler.value();
    } else if (!out.handlers.empty()) {
        out.defaultHandler = out.handlers.front();
    }
    for (const auto& name : deprecated()) {
        auto handler = registry.find(name);
        if (!handler) return handler.error();
        out.deprecatedHandlers.push_back(handler.value());
    }
    return out;
}

bool Policy::operator==(const Policy& other) const {
    return schemeList == other.schemeList && defaultName == other.defaultName &&
           deprecatedList == other.deprecatedList && options == other.options;
}

PolicySource PolicySource::fromMap(IniFile::KeyValues values) {
    PolicySource s;
    s.sourceKind = Kind::Map;
    s.map = std::move(values);
    return s;
}

PolicySource PolicySource::fromText(std::string iniText) {
    PolicySource s;
    s.sourceKind = Kind::Text;
    s.ini = std::move(iniText);
    return s;
}

PolicySource PolicySource::fromPath(std::filesystem::path path) {
    PolicySource s;
    s.sourceKind = Kind::Path;
    s.file = std::move(path);
    return s;
}

PolicySource PolicySource::fromPolicy(Policy policy) {
    PolicySource s;
    s.sourceKind = Kind::Existing;
    s.existing = std::move(policy);
    return s;
}

}
