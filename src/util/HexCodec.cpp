#include "util/HexCodec.hpp"

namespace saltline {
namespace HexCodec {

namespace {
int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}

std::string encode(const std::string& bytes, bool upper) {
    const char* hex = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        unsigned char b = static_cast<unsigned char>(bytes[i]);
        out[2*i] = hex[(b >> 4) & 0xF];
        out[2*i+1] = hex[b & 0xF];
    }
    return out;
}

Expected<std::string> decode(const std::string& text) {
    if (text.size() % 2 != 0) {
        return Error{ErrorCode::InvalidArgs, "hex string has odd length"};
    }
    std::string out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = nibble(text[i]);
        int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error{ErrorCode::InvalidArgs, "invalid hex character"};
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

}  // namespace HexCodec
}  // namespace saltline
