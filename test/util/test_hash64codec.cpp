#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "util/Hash64Codec.hpp"
#include "util/Random.hpp"

using namespace saltline;

// Test: h64 packs bytes least significant bits first
TEST(Hash64CodecTest, H64KnownEncodings) {
    const auto& h64 = Hash64Codec::h64();
    EXPECT_EQ(h64.encodeBytes("abc"), "V7qM");
    EXPECT_EQ(h64.encodeBytes("ab"), "V74");
    EXPECT_EQ(h64.encodeBytes("a"), "V/");
    EXPECT_EQ(h64.encodeBytes(std::string(3, '\0')), "....");
    EXPECT_EQ(h64.encodeBytes(std::string(3, '\xff')), "zzzz");
    EXPECT_EQ(h64.encodeBytes(""), "");
}

// Test: Decoding is the left inverse of encoding for short and long inputs
TEST(Hash64CodecTest, DecodeInvertsEncode) {
    const std::vector<const Hash64Codec*> codecs = {
        &Hash64Codec::h64(), &Hash64Codec::ab64(), &Hash64Codec::b64(), &Hash64Codec::ctaB64()};
    for (const auto* codec : codecs) {
        for (size_t len : {0u, 1u, 2u, 3u, 4u, 5u, 16u, 64u, 100u}) {
            std::string bytes = Random::randomBytes(len);
            auto decoded = codec->decodeBytes(codec->encodeBytes(bytes));
            ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
            EXPECT_EQ(decoded.value(), bytes) << "alphabet " << codec->alphabet() << " length " << len;
        }
    }
}

// Test: Unused bits of the final symbol are ignored on decode
TEST(Hash64CodecTest, PaddingBitsIgnored) {
    const auto& h64 = Hash64Codec::h64();
    // "V/" encodes 'a'; "Vx" also sets the four unused bits of the second symbol
    auto decoded = h64.decodeBytes("Vx");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "a");
}

// Test: A dangling single symbol is rejected
TEST(Hash64CodecTest, RejectsRemainderOfOne) {
    auto decoded = Hash64Codec::h64().decodeBytes("V7qMV");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::InvalidArgs);
}

// Test: Characters outside the alphabet are rejected
TEST(Hash64CodecTest, RejectsForeignCharacters) {
    EXPECT_FALSE(Hash64Codec::h64().decodeBytes("ab+d").has_value());
    EXPECT_FALSE(Hash64Codec::ab64().decodeBytes("ab-d").has_value());
    EXPECT_FALSE(Hash64Codec::h64().isAlphabetString("abc$"));
    EXPECT_TRUE(Hash64Codec::h64().isAlphabetString("./09AZaz"));
}

// Test: Adapted base64 is standard base64 with '.' for '+' and no padding
TEST(Hash64CodecTest, Ab64MatchesBase64) {
    EXPECT_EQ(Hash64Codec::ab64().encodeBytes("abc"), "YWJj");
    EXPECT_EQ(Hash64Codec::ab64().encodeBytes("\xfb\xff"), "./8");
    EXPECT_EQ(Hash64Codec::b64().encodeBytes("\xfb\xff"), "+/8=");
    EXPECT_EQ(Hash64Codec::ctaB64().encodeBytes("\xfb\xff"), "-_8=");
}

// Test: Padded engines accept input with or without '='
TEST(Hash64CodecTest, PaddingAcceptedLazily) {
    const auto& b64 = Hash64Codec::b64();
    auto padded = b64.decodeBytes("YWI=");
    auto bare = b64.decodeBytes("YWI");
    ASSERT_TRUE(padded.has_value());
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(padded.value(), "ab");
    EXPECT_EQ(bare.value(), "ab");
    EXPECT_FALSE(b64.decodeBytes("Y=WI").has_value());
}

// Test: encodedSize matches encodeBytes output
TEST(Hash64CodecTest, EncodedSize) {
    EXPECT_EQ(Hash64Codec::h64().encodedSize(64), 86u);
    EXPECT_EQ(Hash64Codec::ab64().encodedSize(20), 27u);
    EXPECT_EQ(Hash64Codec::ab64().encodedSize(32), 43u);
    EXPECT_EQ(Hash64Codec::ctaB64().encodedSize(20), 28u);
    EXPECT_EQ(Hash64Codec::b64().encodedSize(48), 64u);
}

// Test: Transposed encoding reorders bytes before packing
TEST(Hash64CodecTest, TransposedRoundTrip) {
    const auto& h64 = Hash64Codec::h64();
    std::vector<size_t> offsets = {2, 0, 1};
    std::string encoded = h64.encodeTransposedBytes("abc", offsets);
    EXPECT_EQ(encoded, h64.encodeBytes("cab"));
    auto decoded = h64.decodeTransposedBytes(encoded, offsets);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "abc");
    EXPECT_FALSE(h64.decodeTransposedBytes(h64.encodeBytes("ab"), offsets).has_value());
}

// Test: Alphabets must hold 64 distinct characters
TEST(Hash64CodecTest, RejectsBadAlphabet) {
    EXPECT_THROW((void)Hash64Codec("abc", Hash64Codec::BitOrder::Big), std::invalid_argument);
    std::string repeated = Hash64Codec::h64().alphabet();
    repeated[1] = repeated[0];
    EXPECT_THROW((void)Hash64Codec(repeated, Hash64Codec::BitOrder::Little), std::invalid_argument);
}
