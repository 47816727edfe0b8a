#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace saltline {

/**
 * @brief 6-bits-per-symbol byte codec with a pluggable alphabet
 *
 * Three input bytes become four symbols; a trailing group of 2 bytes becomes
 * 3 symbols and a trailing single byte becomes 2 symbols. The unused high
 * bits of the last symbol are written as zero and ignored on decode, so
 * decodeBytes(encodeBytes(b)) == b for every byte string.
 *
 * Bit order is independent of the alphabet:
 *   Little: the crypt(3) "hash64" packing, v = b0 | b1<<8 | b2<<16,
 *           least significant 6 bits emitted first
 *   Big:    RFC 4648 base64 packing, v = b0<<16 | b1<<8 | b2,
 *           most significant 6 bits emitted first
 *
 * Predefined engines:
 *   h64()    "./0-9A-Za-z", little, unpadded (md5/sha-crypt family)
 *   ab64()   "A-Za-z0-9./", big, unpadded ("adapted base64", $pbkdf2$ family)
 *   b64()    "A-Za-z0-9+/", big, '=' padded (standard base64)
 *   ctaB64() "A-Za-z0-9-_", big, '=' padded (Cryptacular's $p5k2$)
 */
class Hash64Codec {
public:
    enum class BitOrder { Little, Big };

    /// alphabet must hold 64 distinct characters; throws std::invalid_argument otherwise
    Hash64Codec(std::string alphabet, BitOrder order, bool padded = false);

    static const Hash64Codec& h64();
    static const Hash64Codec& ab64();
    static const Hash64Codec& b64();
    static const Hash64Codec& ctaB64();

    std::string encodeBytes(const std::string& bytes) const;

    /// InvalidArgs on symbols outside the alphabet, misplaced padding or a dangling single symbol
    Expected<std::string> decodeBytes(const std::string& text) const;

    /**
     * @brief Encode bytes after reordering them by an offset table
     *
     * Equivalent to encodeBytes(b[offsets[0]] b[offsets[1]] ...).
     * Used by sha512_crypt, whose checksum layout interleaves digest bytes.
     */
    std::string encodeTransposedBytes(const std::string& bytes, const std::vector<size_t>& offsets) const;

    /// Inverse of encodeTransposedBytes; offsets must be a permutation of 0..n-1
    Expected<std::string> decodeTransposedBytes(const std::string& text, const std::vector<size_t>& offsets) const;

    /// Number of symbols encodeBytes produces for byteCount input bytes
    size_t encodedSize(size_t byteCount) const;

    /// True if every character of text belongs to the alphabet (padding not allowed)
    bool isAlphabetString(const std::string& text) const;

    const std::string& alphabet() const { return symbols; }
    BitOrder bitOrder() const { return order; }
    bool padded() const { return usePadding; }

private:
    std::string symbols;
    BitOrder order;
    bool usePadding;
    std::array<int, 256> lookup;   // char -> 6-bit value, -1 if not in alphabet

    void encodeGroup(const unsigned char* in, size_t n, std::string& out) const;
};

}
