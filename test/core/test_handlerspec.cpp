#include <gtest/gtest.h>

#include "core/HandlerSpec.hpp"

using namespace saltline;

namespace {

HandlerSpec saltedSpec() {
    HandlerSpec spec;
    spec.name = "test_scheme";
    spec.idents = {"$t$"};
    spec.settingKwds = {SettingKwd::Salt, SettingKwd::SaltSize, SettingKwd::Rounds};
    spec.salt = SaltPolicy{SaltKind::Chars, 0, 8, 16, HASH64_CHARS, ""};
    spec.rounds = RoundsPolicy{1, 1000, 100000, RoundsCost::Linear, false};
    spec.checksum = ChecksumInfo{20, 27};
    spec.resolveDefaults();
    return spec;
}

void expectMisconfigured(const HandlerSpec& spec) {
    auto result = spec.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MisconfiguredHandler);
}

}

// Test: A consistent spec validates and gets its default charset
TEST(HandlerSpecTest, ValidSpec) {
    HandlerSpec spec = saltedSpec();
    EXPECT_TRUE(spec.validate().has_value());
    EXPECT_EQ(spec.salt->defaultCharset, HASH64_CHARS);
    EXPECT_TRUE(spec.acceptsSetting(SettingKwd::Rounds));
    EXPECT_FALSE(spec.acceptsSetting("ident"));
}

// Test: Names must be lowercase identifiers
TEST(HandlerSpecTest, BadNames) {
    HandlerSpec spec = saltedSpec();
    spec.name = "";
    expectMisconfigured(spec);
    spec.name = "Upper";
    expectMisconfigured(spec);
    spec.name = "dash-name";
    expectMisconfigured(spec);
}

// Test: Idents are required and non-empty
TEST(HandlerSpecTest, BadIdents) {
    HandlerSpec spec = saltedSpec();
    spec.idents.clear();
    expectMisconfigured(spec);
    spec.idents = {""};
    expectMisconfigured(spec);
}

// Test: Capabilities and setting keywords must agree
TEST(HandlerSpecTest, KeywordsMatchCapabilities) {
    HandlerSpec noSaltKwd = saltedSpec();
    noSaltKwd.settingKwds = {SettingKwd::Rounds};
    expectMisconfigured(noSaltKwd);

    HandlerSpec noRoundsPolicy = saltedSpec();
    noRoundsPolicy.rounds.reset();
    expectMisconfigured(noRoundsPolicy);

    HandlerSpec sizeWithoutSalt = saltedSpec();
    sizeWithoutSalt.salt.reset();
    sizeWithoutSalt.settingKwds = {SettingKwd::SaltSize, SettingKwd::Rounds};
    expectMisconfigured(sizeWithoutSalt);
}

// Test: Salt bounds must be ordered
TEST(HandlerSpecTest, SaltBounds) {
    HandlerSpec spec = saltedSpec();
    spec.salt->minSize = 20;
    expectMisconfigured(spec);

    spec = saltedSpec();
    spec.salt->defaultSize = 32;
    expectMisconfigured(spec);

    spec = saltedSpec();
    spec.salt->minSize = 10;
    expectMisconfigured(spec);
}

// Test: Default charset must be a subset of the charset
TEST(HandlerSpecTest, DefaultCharsetSubset) {
    HandlerSpec spec = saltedSpec();
    spec.salt->defaultCharset = "abc!";
    expectMisconfigured(spec);

    spec.salt->defaultCharset = "abc";
    EXPECT_TRUE(spec.validate().has_value());
}

// Test: Rounds bounds and log2 range
TEST(HandlerSpecTest, RoundsBounds) {
    HandlerSpec spec = saltedSpec();
    spec.rounds->defaultRounds = 0;
    expectMisconfigured(spec);

    spec = saltedSpec();
    spec.rounds->maxRounds = 500;
    expectMisconfigured(spec);

    spec = saltedSpec();
    spec.rounds = RoundsPolicy{4, 12, 64, RoundsCost::Log2, false};
    expectMisconfigured(spec);
    spec.rounds->maxRounds = 31;
    EXPECT_TRUE(spec.validate().has_value());
    EXPECT_STREQ(roundsCostName(spec.rounds->cost), "log2");
}
