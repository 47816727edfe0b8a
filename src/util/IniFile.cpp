#include "util/IniFile.hpp"

#include <fstream>
#include <sstream>

namespace saltline {
namespace IniFile {

namespace {
std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}
}

Expected<KeyValues> readSection(const std::string& text, const std::string& section) {
    KeyValues out;
    std::istringstream in(text);
    std::string raw;
    std::string current;
    bool found = false;
    size_t lineNo = 0;

    while (std::getline(in, raw)) {
        ++lineNo;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                return Error{ErrorCode::InvalidPolicy, "line " + std::to_string(lineNo) + ": unterminated section header"};
            }
            current = trim(line.substr(1, line.size() - 2));
            if (current == section) found = true;
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            // ConfigParser also accepts "key: value"
            eq = line.find(':');
        }
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidPolicy, "line " + std::to_string(lineNo) + ": expected 'key = value'"};
        }
        if (current.empty()) {
            return Error{ErrorCode::InvalidPolicy, "line " + std::to_string(lineNo) + ": key outside of any section"};
        }
        if (current != section) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) {
            return Error{ErrorCode::InvalidPolicy, "line " + std::to_string(lineNo) + ": empty key"};
        }
        bool replaced = false;
        for (auto& kv : out) {
            if (kv.first == key) {
                kv.second = value;
                replaced = true;
                break;
            }
        }
        if (!replaced) out.emplace_back(key, value);
    }

    if (!found) {
        return Error{ErrorCode::InvalidPolicy, "section [" + section + "] not found"};
    }
    return out;
}

std::string writeSection(const std::string& section, const KeyValues& values) {
    std::ostringstream out;
    out << "[" << section << "]\n";
    for (const auto& [key, value] : values) {
        out << key << " = " << value << "\n";
    }
    return out.str();
}

Expected<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot open " + path.string()};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "failed reading " + path.string()};
    }
    return buf.str();
}

}  // namespace IniFile
}  // namespace saltline
