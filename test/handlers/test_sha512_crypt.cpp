#include <gtest/gtest.h>

#include "handlers/Sha512CryptHandler.hpp"

using namespace saltline;

namespace {

struct CryptVector {
    const char* secret;
    const char* hash;
};

const CryptVector VECTORS[] = {
    {"Hello world!",
     "$6$rounds=10000$saltstringsaltst$OW1/O6BYHV6BcXZu8QVeXbDWra3Oeqh0sbHbbMCVNSnCM/UrjmM0Dp8vOuZeHBy/YTBmSK6H9qs/"
     "y3RnOaw5v."},
    {"Hello world!",
     "$6$saltstring$svn8UoSVapNtMuq1ukKS4tPQd8iKwSMHWjl/O817G3uBnIFNjnQJuesI68u4OTLiBFdcbYEdFCoEOfaS35inz1"},
    {"test",
     "$6$rounds=1000$test$2M/Lx6MtobqjLjobw0Wmo4Q5OFx5nVLJvmgseatA6oMnyWeBdRDx4DU.1H3eGmse6pgsOgDisWBGI5c7TZauS0"},
    {"test",
     "$6$rounds=5000$saltsalt$JcVDtuB6d1BHhCd5RPBh8g8xX/1CbY8EU2PN0MTaj2/Mypw4P./C6dN4j0HALhzBDTocyW1Jm.gYaTPjFGCV40"},
    {"test",
     "$6$rounds=1000$$vDKCc9rOGoJbVpjMvQImrBCbdha0O.xOzDOISi93TtOhw50y5pfOawbWUBl/.bvAQ9GYV3/rTXJemXg429BHy/"},
    {"pw",
     "$6$rounds=1000$saltsalt$nII71HJmawaDYdXrUHYtoWV/pe6ZN/eQzrZXdKjhrcMU0onLRg6A5m38udZu.lA6f53rIQturF4FMx1X99KF/0"},
};

}

// Test: Reference hashes verify, and fail for other secrets
TEST(Sha512CryptTest, KnownHashes) {
    Sha512CryptHandler handler;
    for (const auto& v : VECTORS) {
        EXPECT_TRUE(handler.identify(v.hash)) << v.hash;
        auto ok = handler.verify(v.secret, v.hash);
        ASSERT_TRUE(ok.has_value()) << ok.error().message;
        EXPECT_TRUE(ok.value()) << v.hash;
        EXPECT_FALSE(handler.verify("not it", v.hash).value()) << v.hash;
    }
}

// Test: Generating from the parsed config reproduces each hash exactly
TEST(Sha512CryptTest, RegeneratesKnownHashes) {
    Sha512CryptHandler handler;
    for (const auto& v : VECTORS) {
        std::string hash = v.hash;
        std::string config = hash.substr(0, hash.rfind('$'));
        auto made = handler.generateHash(v.secret, config);
        ASSERT_TRUE(made.has_value()) << made.error().message;
        EXPECT_EQ(made.value(), hash);
    }
}

// Test: Implicit 5000 rounds and explicit rounds=5000 give the same checksum
TEST(Sha512CryptTest, ImplicitRoundsForm) {
    Sha512CryptHandler handler;
    const std::string checksum =
        "JcVDtuB6d1BHhCd5RPBh8g8xX/1CbY8EU2PN0MTaj2/Mypw4P./C6dN4j0HALhzBDTocyW1Jm.gYaTPjFGCV40";
    const std::string implicitHash = "$6$saltsalt$" + checksum;
    EXPECT_TRUE(handler.verify("test", implicitHash).value());

    auto settings = handler.fromString(implicitHash);
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings.value().rounds, Sha512CryptHandler::IMPLICIT_ROUNDS);
    EXPECT_FALSE(settings.value().roundsExplicit);
    EXPECT_EQ(handler.toString(settings.value()), implicitHash);

    auto explicitSettings = handler.fromString("$6$rounds=5000$saltsalt$" + checksum);
    ASSERT_TRUE(explicitSettings.has_value());
    EXPECT_TRUE(explicitSettings.value().roundsExplicit);
    EXPECT_EQ(handler.toString(explicitSettings.value()), "$6$rounds=5000$saltsalt$" + checksum);
}

// Test: Generated configs leave out 5000 rounds unless asked not to
TEST(Sha512CryptTest, ConfigRendering) {
    Sha512CryptHandler handler;
    SettingsRequest req;
    req.salt = "saltsalt";
    req.rounds = 5000;
    EXPECT_EQ(handler.generateConfig(req).value(), "$6$saltsalt");

    req.implicitRounds = false;
    EXPECT_EQ(handler.generateConfig(req).value(), "$6$rounds=5000$saltsalt");

    req.rounds = 6000;
    req.implicitRounds = true;
    EXPECT_EQ(handler.generateConfig(req).value(), "$6$rounds=6000$saltsalt");
}

// Test: Default config is 40000 rounds and a 16 character hash64 salt
TEST(Sha512CryptTest, DefaultConfig) {
    Sha512CryptHandler handler;
    auto config = handler.generateConfig({});
    ASSERT_TRUE(config.has_value());
    auto settings = handler.fromString(config.value());
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings.value().rounds, 40000u);
    EXPECT_EQ(settings.value().salt.size(), 16u);
    EXPECT_EQ(settings.value().salt.find_first_not_of(HASH64_CHARS), std::string::npos);
}

// Test: Out-of-range configs are corrected, out-of-range hashes rejected
TEST(Sha512CryptTest, Bounds) {
    Sha512CryptHandler handler;
    auto lowConfig = handler.fromString("$6$rounds=10$roundstoolow");
    ASSERT_TRUE(lowConfig.has_value());
    EXPECT_EQ(lowConfig.value().rounds, 1000u);

    auto longSalt = handler.fromString("$6$rounds=1000$toolongsaltstring");
    ASSERT_TRUE(longSalt.has_value());
    EXPECT_EQ(longSalt.value().salt, "toolongsaltstrin");

    auto hash = handler.generateHash("Hello world!", "$6$rounds=1000$toolongsaltstring");
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(hash.value(),
              "$6$rounds=1000$toolongsaltstrin$sesQxVr.eO8J/1tYcwFWM0XaMVaHFLetz9ssK1oNSPUQgLRm8v3S4i6CgxB9aqGOAFF"
              "EMnB2V1gvxEm/Gv2gw/");

    const std::string checksum =
        "2M/Lx6MtobqjLjobw0Wmo4Q5OFx5nVLJvmgseatA6oMnyWeBdRDx4DU.1H3eGmse6pgsOgDisWBGI5c7TZauS0";
    auto lowHash = handler.verify("test", "$6$rounds=999$test$" + checksum);
    ASSERT_FALSE(lowHash.has_value());
    EXPECT_EQ(lowHash.error().code, ErrorCode::InvalidHash);
}

// Test: Malformed strings are not sha512_crypt hashes
TEST(Sha512CryptTest, Malformed) {
    Sha512CryptHandler handler;
    const char* bad[] = {
        "$5$rounds=1000$test$abc",
        "$6$rounds=1000$test$tooshort",
        "$6$rounds=01000$test$2M/Lx6MtobqjLjobw0Wmo4Q5OFx5nVLJvmgseatA6oMnyWeBdRDx4DU.1H3eGmse6pgsOgDisWBGI5c7TZauS0",
        "$6$rounds=1000$te*t$2M/Lx6MtobqjLjobw0Wmo4Q5OFx5nVLJvmgseatA6oMnyWeBdRDx4DU.1H3eGmse6pgsOgDisWBGI5c7TZauS0",
        "$6$rounds=1000$test$2M/Lx6MtobqjLjobw0Wmo4Q5OFx5nVLJvmgseatA6oMnyWeBdRDx4DU.1H3eGmse6pgsOgDisWBGI5c7TZau!0",
        "",
    };
    for (const char* text : bad) {
        EXPECT_FALSE(handler.identify(text)) << text;
        auto res = handler.verify("test", text);
        ASSERT_FALSE(res.has_value()) << text;
        EXPECT_EQ(res.error().code, ErrorCode::InvalidHash);
    }
}
