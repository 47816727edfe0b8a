#include "core/HashContext.hpp"

#include <algorithm>
#include <cmath>

#include "util/Logger.hpp"
#include "util/Random.hpp"

namespace saltline {

namespace {

uint64_t varyAmount(uint64_t base, const VaryRounds& vary) {
    if (!vary.percent) return vary.amount;
    return (base / 100) * vary.amount + (base % 100) * vary.amount / 100;
}

/// Uniform pick from [base - vary, base + vary], measured in iterations even for log2 costs
uint32_t jitterRounds(uint32_t base, const VaryRounds& vary, RoundsCost cost) {
    if (cost == RoundsCost::Linear) {
        uint64_t v = varyAmount(base, vary);
        uint64_t lo = base > v ? base - v : 1;
        uint64_t hi = std::min<uint64_t>(static_cast<uint64_t>(base) + v, UINT32_MAX);
        return static_cast<uint32_t>(Random::randomInt(lo, hi));
    }
    uint64_t linear = uint64_t{1} << std::min<uint32_t>(base, 63);
    uint64_t v = varyAmount(linear, vary);
    uint64_t lo = linear > v ? linear - v : 1;
    uint64_t hi = (UINT64_MAX - linear < v) ? UINT64_MAX : linear + v;
    uint64_t pick = Random::randomInt(lo, hi);
    return static_cast<uint32_t>(std::lround(std::log2(static_cast<long double>(pick))));
}

Error noSuchScheme(const std::string& name) {
    return Error{ErrorCode::UnknownScheme, "scheme '" + name + "' is not part of this context"};
}

}

Expected<HashContext> HashContext::create(const Policy& policy) {
    return bind(policy, HandlerRegistry::global(), nullptr);
}

Expected<HashContext> HashContext::create(const Policy& policy, std::shared_ptr<const HandlerRegistry> registry) {
    if (!registry) {
        return Error{ErrorCode::InvalidArgs, "hash context needs a registry"};
    }
    const HandlerRegistry& lookup = *registry;
    return bind(policy, lookup, std::move(registry));
}

Expected<HashContext> HashContext::bind(const Policy& policy, const HandlerRegistry& lookup,
                                        std::shared_ptr<const HandlerRegistry> owner) {
    auto resolved = policy.resolved(lookup);
    if (!resolved) return resolved.error();

    HashContext ctx;
    ctx.activePolicy = policy;
    ctx.schemeHandlers = resolved.value().handlers;
    ctx.fallback = resolved.value().defaultHandler;
    ctx.registry = std::move(owner);

    if (policy.defaultScheme()) {
        const std::string& name = *policy.defaultScheme();
        bool listed = std::any_of(ctx.schemeHandlers.begin(), ctx.schemeHandlers.end(),
                                  [&](const auto& h) { return h->name() == name; });
        if (!listed) {
            return Error{ErrorCode::UnknownScheme, "default scheme '" + name + "' is not in the schemes list"};
        }
    }
    Logger& log = Logger::instance();
    if (log.enabled(LogLevel::Debug)) {
        log.debug("hash context: " + std::to_string(ctx.schemeHandlers.size()) + " schemes, default " +
                  (ctx.fallback ? ctx.fallback->name() : std::string("<none>")));
    }
    return ctx;
}

Expected<HashContext> HashContext::replace(const Policy& overlay) const {
    Policy merged = activePolicy.replace(overlay);
    if (!registry) return create(merged);
    return create(merged, registry);
}

Expected<std::shared_ptr<const IHandler>> HashContext::findHandler(const std::string& name) const {
    for (const auto& h : schemeHandlers) {
        if (h->name() == name) return h;
    }
    return noSuchScheme(name);
}

Expected<std::shared_ptr<const IHandler>> HashContext::targetHandler(const std::optional<std::string>& scheme) const {
    if (scheme) return findHandler(*scheme);
    if (!fallback) {
        return Error{ErrorCode::UnknownScheme, "no schemes configured"};
    }
    return fallback;
}

SettingsRequest HashContext::applyPolicy(const IHandler& handler, const SettingsRequest& overrides,
                                         const std::optional<std::string>& category) const {
    SettingsRequest req = overrides;
    const HandlerSpec& spec = handler.spec();
    HandlerOptions opts = activePolicy.getOptions(handler.name(), category);

    if (spec.acceptsSetting(SettingKwd::SaltSize) && !req.salt && !req.saltSize && opts.saltSize) {
        req.saltSize = opts.saltSize;
    }
    if (!spec.rounds) return req;

    if (!req.rounds) {
        if (opts.rounds) {
            req.rounds = opts.rounds;
        } else {
            uint32_t base = opts.defaultRounds.value_or(spec.rounds->defaultRounds);
            if (opts.varyRounds && opts.varyRounds->amount > 0) {
                base = jitterRounds(base, *opts.varyRounds, spec.rounds->cost);
            }
            req.rounds = base;
        }
    }

    const std::string& name = handler.name();
    if (opts.minRounds && *req.rounds < *opts.minRounds) {
        Logger::instance().warn(name + ": rounds " + std::to_string(*req.rounds) + " below policy min_rounds, using " +
                                std::to_string(*opts.minRounds));
        req.rounds = opts.minRounds;
    }
    if (opts.maxRounds && *req.rounds > *opts.maxRounds) {
        Logger::instance().warn(name + ": rounds " + std::to_string(*req.rounds) + " above policy max_rounds, using " +
                                std::to_string(*opts.maxRounds));
        req.rounds = opts.maxRounds;
    }
    return req;
}

Expected<std::string> HashContext::encrypt(const std::string& secret, const std::optional<std::string>& scheme,
                                           const SettingsRequest& overrides,
                                           const std::optional<std::string>& category) const {
    auto handler = targetHandler(scheme);
    if (!handler) return handler.error();
    SettingsRequest req = applyPolicy(*handler.value(), overrides, category);
    return handler.value()->encrypt(secret, req);
}

Expected<std::string> HashContext::genconfig(const std::optional<std::string>& scheme,
                                             const SettingsRequest& overrides,
                                             const std::optional<std::string>& category) const {
    auto handler = targetHandler(scheme);
    if (!handler) return handler.error();
    SettingsRequest req = applyPolicy(*handler.value(), overrides, category);
    return handler.value()->generateConfig(req);
}

Expected<std::string> HashContext::genhash(const std::string& secret, const std::string& config,
                                           const std::optional<std::string>& scheme) const {
    auto handler = scheme ? findHandler(*scheme) : identifyHandler(config, true);
    if (!handler) return handler.error();
    return handler.value()->generateHash(secret, config);
}

Expected<std::shared_ptr<const IHandler>> HashContext::identifyHandler(const std::optional<std::string>& hash,
                                                                       bool required) const {
    if (hash) {
        for (const auto& h : schemeHandlers) {
            if (h->identify(*hash)) return h;
        }
    }
    if (required) {
        return Error{ErrorCode::UnknownScheme, hash ? "hash could not be identified" : "no hash given"};
    }
    return std::shared_ptr<const IHandler>();
}

Expected<std::optional<std::string>> HashContext::identify(const std::optional<std::string>& hash, bool required) const {
    auto handler = identifyHandler(hash, required);
    if (!handler) return handler.error();
    if (!handler.value()) return std::optional<std::string>();
    return std::optional<std::string>(handler.value()->name());
}

Expected<bool> HashContext::verify(const std::string& secret, const std::optional<std::string>& hash,
                                   const std::optional<std::string>& scheme) const {
    if (!hash || hash->empty()) return false;
    auto handler = scheme ? findHandler(*scheme) : identifyHandler(hash, true);
    if (!handler) return handler.error();
    return handler.value()->verify(secret, *hash);
}

bool HashContext::handlerIsDeprecated(const std::string& scheme) const {
    return activePolicy.handlerIsDeprecated(scheme);
}

bool HashContext::handlerIsDeprecated(const IHandler& handler) const {
    return handlerIsDeprecated(handler.name());
}

Expected<bool> HashContext::hashNeedsUpdate(const std::string& hash, const std::optional<std::string>& category) const {
    auto handler = identifyHandler(hash, true);
    if (!handler) return handler.error();
    const IHandler& h = *handler.value();
    if (handlerIsDeprecated(h)) return true;
    if (!h.spec().rounds) return false;

    auto settings = h.fromString(hash);
    if (!settings) return settings.error();
    if (!settings.value().rounds) return false;
    uint32_t rounds = *settings.value().rounds;
    HandlerOptions opts = activePolicy.getOptions(h.name(), category);
    if (opts.minRounds && rounds < *opts.minRounds) return true;
    if (opts.maxRounds && rounds > *opts.maxRounds) return true;
    return false;
}

Expected<std::pair<bool, std::optional<std::string>>> HashContext::verifyAndUpdate(
    const std::string& secret, const std::string& hash, const std::optional<std::string>& category) const {
    using Result = std::pair<bool, std::optional<std::string>>;
    auto ok = verify(secret, hash);
    if (!ok) return ok.error();
    if (!ok.value()) return Result{false, std::nullopt};

    auto stale = hashNeedsUpdate(hash, category);
    if (!stale) return stale.error();
    if (!stale.value()) return Result{true, std::nullopt};

    auto fresh = encrypt(secret, std::nullopt, {}, category);
    if (!fresh) return fresh.error();
    Logger::instance().info("hash needed an update, rehashed under " + fallback->name());
    return Result{true, fresh.value()};
}

}
