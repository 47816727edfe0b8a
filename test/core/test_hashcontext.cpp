#include <gtest/gtest.h>

#include <memory>

#include "core/HashContext.hpp"
#include "handlers/Pbkdf2DigestHandler.hpp"

using namespace saltline;

namespace {

HashContext makeContext(const IniFile::KeyValues& values) {
    auto policy = Policy::fromMap(values);
    EXPECT_TRUE(policy.has_value()) << policy.error().message;
    auto ctx = HashContext::create(policy.value());
    EXPECT_TRUE(ctx.has_value()) << ctx.error().message;
    return ctx.has_value() ? ctx.value() : HashContext();
}

uint32_t roundsOf(const HashContext& ctx, const std::string& hash) {
    auto handler = ctx.identifyHandler(hash, true);
    EXPECT_TRUE(handler.has_value());
    auto settings = handler.value()->fromString(hash);
    EXPECT_TRUE(settings.has_value());
    return settings.value().rounds.value_or(0);
}

const char* SHA256_HASH = "$pbkdf2-sha256$1000$c2FsdA$YywoEuRtRgQQK6dhjp1tfS.BKPYma0oDJk0qBGC33LM";
const char* SHA1_HASH = "$pbkdf2$1000$c2FsdA$boi.i61.rp2eEKoGEiQDT.1I0D8";

}

// Test: The first scheme is the default when none is named
TEST(HashContextTest, DefaultScheme) {
    HashContext ctx = makeContext({{"schemes", "pbkdf2_sha1, pbkdf2_sha256"}});
    ASSERT_NE(ctx.defaultHandler(), nullptr);
    EXPECT_EQ(ctx.defaultHandler()->name(), "pbkdf2_sha1");
    EXPECT_EQ(ctx.handlers().size(), 2u);

    HashContext named = makeContext({{"schemes", "pbkdf2_sha1, pbkdf2_sha256"}, {"default", "pbkdf2_sha256"}});
    EXPECT_EQ(named.defaultHandler()->name(), "pbkdf2_sha256");
}

// Test: A default outside the scheme list and unregistered schemes are UnknownScheme
TEST(HashContextTest, CreateErrors) {
    auto outside = Policy::fromMap({{"schemes", "pbkdf2_sha1"}, {"default", "pbkdf2_sha256"}});
    ASSERT_TRUE(outside.has_value());
    auto ctx = HashContext::create(outside.value());
    ASSERT_FALSE(ctx.has_value());
    EXPECT_EQ(ctx.error().code, ErrorCode::UnknownScheme);

    auto unknown = Policy::fromMap({{"schemes", "md5_crypt"}});
    ASSERT_TRUE(unknown.has_value());
    EXPECT_FALSE(HashContext::create(unknown.value()).has_value());
}

// Test: An empty context has nothing to hash with
TEST(HashContextTest, EmptyContext) {
    HashContext ctx;
    auto hash = ctx.encrypt("pw");
    ASSERT_FALSE(hash.has_value());
    EXPECT_EQ(hash.error().code, ErrorCode::UnknownScheme);
    EXPECT_FALSE(ctx.identify(std::string(SHA1_HASH)).value().has_value());
}

// Test: identify walks schemes and handles absent input
TEST(HashContextTest, Identify) {
    HashContext ctx = makeContext({{"schemes", "pbkdf2_sha1, pbkdf2_sha256"}});
    EXPECT_EQ(ctx.identify(std::string(SHA256_HASH)).value(), std::optional<std::string>("pbkdf2_sha256"));
    EXPECT_EQ(ctx.identify(std::string(SHA1_HASH)).value(), std::optional<std::string>("pbkdf2_sha1"));

    auto none = ctx.identify(std::nullopt);
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none.value().has_value());

    auto foreign = ctx.identify(std::string("$1$abc$def"));
    ASSERT_TRUE(foreign.has_value());
    EXPECT_FALSE(foreign.value().has_value());

    auto required = ctx.identify(std::string("$1$abc$def"), true);
    ASSERT_FALSE(required.has_value());
    EXPECT_EQ(required.error().code, ErrorCode::UnknownScheme);
    EXPECT_FALSE(ctx.identify(std::nullopt, true).has_value());
}

// Test: Scheme list order settles which handler claims a shared ident
TEST(HashContextTest, SharedIdentOrder) {
    const std::string cta = "$p5k2$3e8$AAECAwQFBgcICQoLDA0ODw==$Awni_k4L3-fQ_kgo1BwjRBbi2b8=";
    const std::string dlitz = "$p5k2$c$u9HvcT4d$Sd1gwSVCLZYAuqZ25piRnbBEoAesaa/g";
    HashContext ctx = makeContext({{"schemes", "dlitz_pbkdf2_sha1, cta_pbkdf2_sha1"}});
    EXPECT_EQ(ctx.identify(cta).value(), std::optional<std::string>("cta_pbkdf2_sha1"));
    EXPECT_EQ(ctx.identify(dlitz).value(), std::optional<std::string>("dlitz_pbkdf2_sha1"));
}

// Test: verify identifies the scheme, empty hashes are simply false
TEST(HashContextTest, Verify) {
    HashContext ctx = makeContext({{"schemes", "pbkdf2_sha1, pbkdf2_sha256"}});
    EXPECT_TRUE(ctx.verify("password", std::string(SHA256_HASH)).value());
    EXPECT_FALSE(ctx.verify("wrong", std::string(SHA256_HASH)).value());
    EXPECT_TRUE(ctx.verify("password", std::string(SHA1_HASH)).value());

    auto empty = ctx.verify("password", std::string());
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty.value());
    EXPECT_FALSE(ctx.verify("password", std::nullopt).value());

    auto unknown = ctx.verify("password", std::string("$1$abc$def"));
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownScheme);
}

// Test: Explicit scheme must be configured and must match the hash
TEST(HashContextTest, VerifyExplicitScheme) {
    HashContext ctx = makeContext({{"schemes", "pbkdf2_sha1, pbkdf2_sha256"}});
    EXPECT_TRUE(ctx.verify("password", std::string(SHA256_HASH), std::string("pbkdf2_sha256")).value());

    auto wrongScheme = ctx.verify("password", std::string(SHA256_HASH), std::string("pbkdf2_sha1"));
    ASSERT_FALSE(wrongScheme.has_value());
    EXPECT_EQ(wrongScheme.error().code, ErrorCode::InvalidHash);

    auto notConfigured = ctx.verify("password", std::string(SHA256_HASH), std::string("sha512_crypt"));
    ASSERT_FALSE(notConfigured.has_value());
    EXPECT_EQ(notConfigured.error().code, ErrorCode::UnknownScheme);
}

// Test: encrypt uses the default scheme and verifies
TEST(HashContextTest, EncryptRoundTrip) {
    HashContext ctx = makeContext({
        {"schemes", "pbkdf2_sha256, sha512_crypt"},
        {"all.default_rounds", "1000"},
    });
    auto hash = ctx.encrypt("s3cret");
    ASSERT_TRUE(hash.has_value()) << hash.error().message;
    EXPECT_EQ(hash.value().rfind("$pbkdf2-sha256$1000$", 0), 0u);
    EXPECT_TRUE(ctx.verify("s3cret", hash.value()).value());

    auto crypt = ctx.encrypt("s3cret", std::string("sha512_crypt"));
    ASSERT_TRUE(crypt.has_value());
    EXPECT_EQ(crypt.value().rfind("$6$rounds=1000$", 0), 0u);
    EXPECT_TRUE(ctx.verify("s3cret", crypt.value()).value());

    auto missing = ctx.encrypt("s3cret", std::string("grub_pbkdf2_sha512"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::UnknownScheme);
}

// Test: Policy rounds, salt_size and category options reach the hash
TEST(HashContextTest, PolicyOptionsApplied) {
    HashContext ctx = makeContext({
        {"schemes", "pbkdf2_sha256"},
        {"pbkdf2_sha256.rounds", "1500"},
        {"admin.rounds", "2500"},
        {"all.salt_size", "8"},
    });
    auto hash = ctx.encrypt("pw");
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(roundsOf(ctx, hash.value()), 1500u);

    // scheme-specific beats category
    auto admin = ctx.encrypt("pw", std::nullopt, {}, std::string("admin"));
    ASSERT_TRUE(admin.has_value());
    EXPECT_EQ(roundsOf(ctx, admin.value()), 1500u);

    auto settings = ctx.defaultHandler()->fromString(hash.value());
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings.value().salt.size(), 8u);

    SettingsRequest req;
    req.rounds = 1200;
    req.saltSize = 4;
    auto overridden = ctx.encrypt("pw", std::nullopt, req);
    ASSERT_TRUE(overridden.has_value());
    EXPECT_EQ(roundsOf(ctx, overridden.value()), 1200u);
    EXPECT_EQ(ctx.defaultHandler()->fromString(overridden.value()).value().salt.size(), 4u);
}

// Test: Category options apply when the scheme has none
TEST(HashContextTest, CategoryOptions) {
    HashContext ctx = makeContext({
        {"schemes", "pbkdf2_sha256"},
        {"all.default_rounds", "1000"},
        {"admin.default_rounds", "3000"},
    });
    auto user = ctx.encrypt("pw");
    auto admin = ctx.encrypt("pw", std::nullopt, {}, std::string("admin"));
    ASSERT_TRUE(user.has_value());
    ASSERT_TRUE(admin.has_value());
    EXPECT_EQ(roundsOf(ctx, user.value()), 1000u);
    EXPECT_EQ(roundsOf(ctx, admin.value()), 3000u);
}

// Test: vary_rounds keeps generated rounds inside the jitter window
TEST(HashContextTest, VaryRounds) {
    HashContext ctx = makeContext({
        {"schemes", "pbkdf2_sha1"},
        {"all.default_rounds", "1000"},
        {"all.vary_rounds", "10%"},
    });
    for (int i = 0; i < 20; ++i) {
        auto config = ctx.genconfig();
        ASSERT_TRUE(config.has_value());
        uint32_t rounds = roundsOf(ctx, config.value());
        EXPECT_GE(rounds, 900u);
        EXPECT_LE(rounds, 1100u);
    }

    HashContext absolute = makeContext({
        {"schemes", "pbkdf2_sha1"},
        {"all.default_rounds", "1000"},
        {"all.vary_rounds", "50"},
    });
    for (int i = 0; i < 20; ++i) {
        uint32_t rounds = roundsOf(absolute, absolute.genconfig().value());
        EXPECT_GE(rounds, 950u);
        EXPECT_LE(rounds, 1050u);
    }
}

// Test: min_rounds and max_rounds clamp every request
TEST(HashContextTest, PolicyBoundsClamp) {
    HashContext ctx = makeContext({
        {"schemes", "pbkdf2_sha256"},
        {"all.min_rounds", "2000"},
        {"all.max_rounds", "3000"},
    });
    SettingsRequest low;
    low.rounds = 10;
    EXPECT_EQ(roundsOf(ctx, ctx.genconfig(std::nullopt, low).value()), 2000u);

    SettingsRequest high;
    high.rounds = 100000;
    EXPECT_EQ(roundsOf(ctx, ctx.genconfig(std::nullopt, high).value()), 3000u);

    // handler default 6400 is above max_rounds
    EXPECT_EQ(roundsOf(ctx, ctx.genconfig().value()), 3000u);
}

// Test: genhash reuses the config's salt and rounds
TEST(HashContextTest, Genhash) {
    HashContext ctx = makeContext({{"schemes", "pbkdf2_sha256"}});
    auto hash = ctx.genhash("password", "$pbkdf2-sha256$1000$c2FsdA");
    ASSERT_TRUE(hash.has_value()) << hash.error().message;
    EXPECT_EQ(hash.value(), SHA256_HASH);

    auto unknown = ctx.genhash("password", "$x$1$2");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownScheme);
}

// Test: Deprecated schemes and out-of-bounds rounds need an update
TEST(HashContextTest, HashNeedsUpdate) {
    HashContext ctx = makeContext({
        {"schemes", "pbkdf2_sha256, pbkdf2_sha1"},
        {"deprecated", "pbkdf2_sha1"},
        {"pbkdf2_sha256.min_rounds", "500"},
        {"pbkdf2_sha256.max_rounds", "5000"},
    });
    EXPECT_TRUE(ctx.handlerIsDeprecated("pbkdf2_sha1"));
    EXPECT_TRUE(ctx.hashNeedsUpdate(SHA1_HASH).value());
    EXPECT_FALSE(ctx.hashNeedsUpdate(SHA256_HASH).value());

    HashContext strict = ctx.replace(Policy::fromMap({{"pbkdf2_sha256.min_rounds", "2000"}}).value()).value();
    EXPECT_TRUE(strict.hashNeedsUpdate(SHA256_HASH).value());
    EXPECT_EQ(strict.policy().getOptions("pbkdf2_sha256").maxRounds, 5000u);

    auto unknown = ctx.hashNeedsUpdate("$1$abc$def");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownScheme);
}

// Test: verifyAndUpdate only rehashes on a match that needs it
TEST(HashContextTest, VerifyAndUpdate) {
    HashContext ctx = makeContext({
        {"schemes", "pbkdf2_sha256, pbkdf2_sha1"},
        {"deprecated", "pbkdf2_sha1"},
        {"all.default_rounds", "1000"},
    });

    auto wrong = ctx.verifyAndUpdate("nope", SHA1_HASH);
    ASSERT_TRUE(wrong.has_value());
    EXPECT_FALSE(wrong.value().first);
    EXPECT_FALSE(wrong.value().second.has_value());

    auto current = ctx.verifyAndUpdate("password", SHA256_HASH);
    ASSERT_TRUE(current.has_value());
    EXPECT_TRUE(current.value().first);
    EXPECT_FALSE(current.value().second.has_value());

    auto migrated = ctx.verifyAndUpdate("password", SHA1_HASH);
    ASSERT_TRUE(migrated.has_value());
    EXPECT_TRUE(migrated.value().first);
    ASSERT_TRUE(migrated.value().second.has_value());
    const std::string& fresh = *migrated.value().second;
    EXPECT_EQ(ctx.identify(fresh).value(), std::optional<std::string>("pbkdf2_sha256"));
    EXPECT_TRUE(ctx.verify("password", fresh).value());
}

// Test: A context keeps a private registry alive after the caller drops it
TEST(HashContextTest, OwnsPrivateRegistry) {
    std::weak_ptr<const HandlerRegistry> watch;
    HashContext ctx;
    {
        auto registry = std::make_shared<HandlerRegistry>();
        ASSERT_TRUE(registry->registerHandler(Pbkdf2DigestHandler::create("sha1")).has_value());
        ASSERT_TRUE(registry->registerHandler(Pbkdf2DigestHandler::create("sha512")).has_value());
        watch = registry;

        auto policy = Policy::fromMap({{"schemes", "pbkdf2_sha1"}});
        ASSERT_TRUE(policy.has_value());
        auto created = HashContext::create(policy.value(), registry);
        ASSERT_TRUE(created.has_value()) << created.error().message;
        ctx = created.value();
    }
    EXPECT_FALSE(watch.expired());

    {
        auto wider = ctx.replace(Policy::fromMap({{"schemes", "pbkdf2_sha1, pbkdf2_sha512"}}).value());
        ASSERT_TRUE(wider.has_value()) << wider.error().message;
        EXPECT_EQ(wider.value().handlers().size(), 2u);
        EXPECT_TRUE(wider.value().verify("password", "$pbkdf2$1000$c2FsdA$boi.i61.rp2eEKoGEiQDT.1I0D8").value());

        // lookups still go to the private registry, not the global one
        auto foreign = ctx.replace(Policy::fromMap({{"schemes", "sha512_crypt"}}).value());
        ASSERT_FALSE(foreign.has_value());
        EXPECT_EQ(foreign.error().code, ErrorCode::UnknownScheme);
    }

    ctx = HashContext();
    EXPECT_TRUE(watch.expired());

    auto none = HashContext::create(Policy(), nullptr);
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, ErrorCode::InvalidArgs);
}
