#include "util/Hash64Codec.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace saltline {

Hash64Codec::Hash64Codec(std::string alphabet, BitOrder order, bool padded)
    : symbols(std::move(alphabet)), order(order), usePadding(padded) {
    if (symbols.size() != 64) {
        throw std::invalid_argument("hash64 alphabet must have 64 characters");
    }
    lookup.fill(-1);
    for (size_t i = 0; i < symbols.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(symbols[i]);
        if (lookup[c] != -1 || c == '=') {
            throw std::invalid_argument("hash64 alphabet has a repeated or reserved character");
        }
        lookup[c] = static_cast<int>(i);
    }
}

const Hash64Codec& Hash64Codec::h64() {
    static const Hash64Codec codec(
        "./0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz", BitOrder::Little);
    return codec;
}

const Hash64Codec& Hash64Codec::ab64() {
    static const Hash64Codec codec(
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789./", BitOrder::Big);
    return codec;
}

const Hash64Codec& Hash64Codec::b64() {
    static const Hash64Codec codec(
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/", BitOrder::Big, true);
    return codec;
}

const Hash64Codec& Hash64Codec::ctaB64() {
    static const Hash64Codec codec(
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_", BitOrder::Big, true);
    return codec;
}

void Hash64Codec::encodeGroup(const unsigned char* in, size_t n, std::string& out) const {
    // n is 1..3 bytes -> n+1 symbols
    uint32_t v = 0;
    if (order == BitOrder::Little) {
        for (size_t i = 0; i < n; ++i) v |= static_cast<uint32_t>(in[i]) << (8 * i);
        for (size_t i = 0; i <= n; ++i) out.push_back(symbols[(v >> (6 * i)) & 0x3F]);
    } else {
        for (size_t i = 0; i < n; ++i) v |= static_cast<uint32_t>(in[i]) << (16 - 8 * i);
        for (size_t i = 0; i <= n; ++i) out.push_back(symbols[(v >> (18 - 6 * i)) & 0x3F]);
    }
}

std::string Hash64Codec::encodeBytes(const std::string& bytes) const {
    std::string out;
    out.reserve(encodedSize(bytes.size()) + 2);
    const unsigned char* data = reinterpret_cast<const unsigned char*>(bytes.data());
    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        encodeGroup(data + i, 3, out);
    }
    size_t tail = bytes.size() - i;
    if (tail > 0) {
        encodeGroup(data + i, tail, out);
        if (usePadding) out.append(3 - tail, '=');
    }
    return out;
}

Expected<std::string> Hash64Codec::decodeBytes(const std::string& text) const {
    std::string body = text;
    if (usePadding) {
        size_t firstPad = body.find('=');
        if (firstPad != std::string::npos) {
            if (body.size() % 4 != 0 || body.size() - firstPad > 2 ||
                body.find_first_not_of('=', firstPad) != std::string::npos) {
                return Error{ErrorCode::InvalidArgs, "misplaced base64 padding"};
            }
            body.resize(firstPad);
        }
    }
    if (body.size() % 4 == 1) {
        return Error{ErrorCode::InvalidArgs, "encoded length leaves a dangling symbol"};
    }

    std::string out;
    out.reserve(body.size() * 3 / 4);
    for (size_t i = 0; i < body.size(); i += 4) {
        size_t n = std::min<size_t>(4, body.size() - i);
        uint32_t v = 0;
        for (size_t k = 0; k < n; ++k) {
            int sym = lookup[static_cast<unsigned char>(body[i + k])];
            if (sym < 0) {
                return Error{ErrorCode::InvalidArgs, std::string("invalid character '") + body[i + k] + "'"};
            }
            if (order == BitOrder::Little) {
                v |= static_cast<uint32_t>(sym) << (6 * k);
            } else {
                v |= static_cast<uint32_t>(sym) << (18 - 6 * k);
            }
        }
        // n symbols carry n-1 whole bytes; leftover bits are padding
        for (size_t k = 0; k + 1 < n; ++k) {
            uint32_t b = (order == BitOrder::Little) ? (v >> (8 * k)) : (v >> (16 - 8 * k));
            out.push_back(static_cast<char>(b & 0xFF));
        }
    }
    return out;
}

std::string Hash64Codec::encodeTransposedBytes(const std::string& bytes, const std::vector<size_t>& offsets) const {
    std::string reordered;
    reordered.reserve(offsets.size());
    for (size_t off : offsets) {
        if (off >= bytes.size()) {
            throw std::out_of_range("transpose offset past end of input");
        }
        reordered.push_back(bytes[off]);
    }
    return encodeBytes(reordered);
}

Expected<std::string> Hash64Codec::decodeTransposedBytes(const std::string& text, const std::vector<size_t>& offsets) const {
    auto decoded = decodeBytes(text);
    if (!decoded) return decoded.error();
    const std::string& tmp = decoded.value();
    if (tmp.size() != offsets.size()) {
        return Error{ErrorCode::InvalidArgs, "transposed data has wrong length"};
    }
    std::string out(tmp.size(), '\0');
    for (size_t i = 0; i < offsets.size(); ++i) {
        if (offsets[i] >= out.size()) {
            return Error{ErrorCode::InvalidArgs, "transpose offset past end of output"};
        }
        out[offsets[i]] = tmp[i];
    }
    return out;
}

size_t Hash64Codec::encodedSize(size_t byteCount) const {
    size_t full = (byteCount / 3) * 4;
    size_t tail = byteCount % 3;
    if (tail == 0) return full;
    return usePadding ? full + 4 : full + tail + 1;
}

bool Hash64Codec::isAlphabetString(const std::string& text) const {
    for (char c : text) {
        if (lookup[static_cast<unsigned char>(c)] < 0) return false;
    }
    return true;
}

}
