#include <gtest/gtest.h>

#include "util/HexCodec.hpp"

using namespace saltline;

// Test: Encoding in both cases
TEST(HexCodecTest, EncodeLowerAndUpper) {
    EXPECT_EQ(HexCodec::encode("\x01\xab\xff"), "01abff");
    EXPECT_EQ(HexCodec::encode("\x01\xab\xff", true), "01ABFF");
    EXPECT_EQ(HexCodec::encode(""), "");
}

// Test: Decoding accepts either case
TEST(HexCodecTest, DecodeMixedCase) {
    auto decoded = HexCodec::decode("01aBfF");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "\x01\xab\xff");
}

// Test: Odd length and non-hex characters are errors
TEST(HexCodecTest, DecodeErrors) {
    auto odd = HexCodec::decode("abc");
    ASSERT_FALSE(odd.has_value());
    EXPECT_EQ(odd.error().code, ErrorCode::InvalidArgs);
    EXPECT_FALSE(HexCodec::decode("zz").has_value());
}
