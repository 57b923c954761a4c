#include <gtest/gtest.h>

#include "exchange/gamma_rest.hpp"
#include "exchange/market_resolver.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

using namespace exchange;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
    std::chrono::steady_clock::time_point now{std::chrono::steady_clock::time_point{} + 1h};

    utils::TtlCache<std::string, std::optional<Market>>::NowFn fn() {
        return [this] { return now; };
    }
};

Market sample_market() {
    Market m;
    m.id             = "501";
    m.slug           = "will-it-rain";
    m.question       = "Will it rain?";
    m.closed         = false;
    m.clob_token_ids = {"111", "222"};
    return m;
}

} // namespace

TEST(MarketResolver, HitIsCachedUnderEveryAlias) {
    FakeClock clock;
    int token_calls = 0;
    int id_calls    = 0;

    MarketResolver::Fetchers f;
    f.by_token_id = [&](const std::string&) -> std::optional<Market> { ++token_calls; return sample_market(); };
    f.by_id       = [&](const std::string&) -> std::optional<Market> { ++id_calls; return std::nullopt; };
    MarketResolver resolver(f, 60s, 10s, clock.fn());

    auto m = resolver.resolve_by_token_id("111");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->question, "Will it rain?");
    EXPECT_EQ(token_calls, 1);

    EXPECT_TRUE(resolver.resolve_by_token_id("222").has_value());
    EXPECT_TRUE(resolver.resolve_by_id("501").has_value());
    EXPECT_TRUE(resolver.resolve_by_slug("will-it-rain").has_value());
    EXPECT_EQ(token_calls, 1);
    EXPECT_EQ(id_calls, 0);

    clock.now += 61s;
    EXPECT_FALSE(resolver.cached("token:111").has_value());
    resolver.resolve_by_token_id("111");
    EXPECT_EQ(token_calls, 2);
}

TEST(MarketResolver, MissIsCachedForTheNegativeTtl) {
    FakeClock clock;
    int calls = 0;

    MarketResolver::Fetchers f;
    f.by_token_id = [&](const std::string&) -> std::optional<Market> { ++calls; return std::nullopt; };
    MarketResolver resolver(f, 60s, 10s, clock.fn());

    EXPECT_FALSE(resolver.resolve_by_token_id("999").has_value());
    EXPECT_FALSE(resolver.resolve_by_token_id("999").has_value());
    EXPECT_EQ(calls, 1);

    auto cached = resolver.cached("token:999");
    ASSERT_TRUE(cached.has_value());
    EXPECT_FALSE(cached->has_value());

    clock.now += 10s;
    resolver.resolve_by_token_id("999");
    EXPECT_EQ(calls, 2);
}

TEST(MarketResolver, FetchFailureResolvesToNothing) {
    int calls = 0;

    MarketResolver::Fetchers f;
    f.by_slug = [&](const std::string&) -> std::optional<Market> {
        ++calls;
        throw std::runtime_error("HTTP 503");
    };
    MarketResolver resolver(f);

    EXPECT_NO_THROW({
        EXPECT_FALSE(resolver.resolve_by_slug("x").has_value());
        EXPECT_FALSE(resolver.resolve_by_slug("x").has_value());
    });
    EXPECT_EQ(calls, 1);
}

TEST(MarketResolver, MissingFetcherResolvesToNothing) {
    MarketResolver resolver(MarketResolver::Fetchers{});
    EXPECT_FALSE(resolver.resolve_by_id("1").has_value());
}

TEST(MarketResolver, TokenIdIsAddedToResolvedMarket) {
    MarketResolver::Fetchers f;
    f.by_token_id = [](const std::string&) -> std::optional<Market> {
        Market m = sample_market();
        m.clob_token_ids.clear();
        return m;
    };
    MarketResolver resolver(f);

    auto m = resolver.resolve_by_token_id("333");
    ASSERT_TRUE(m.has_value());
    ASSERT_EQ(m->clob_token_ids.size(), 1u);
    EXPECT_EQ(m->clob_token_ids[0], "333");
}

TEST(GammaRest, ParseMarketAcceptsEveryListEncoding) {
    const nlohmann::json j = {
        {"id", 501},
        {"slug", "will-it-rain"},
        {"question", "Will it rain?"},
        {"conditionId", "0xabc"},
        {"closed", true},
        {"outcomes", "[\"Yes\",\"No\"]"},
        {"outcomePrices", nlohmann::json::array({"0.25", "0.75"})},
        {"clobTokenIds", "111, 222"},
    };

    const Market m = GammaRest::parse_market(j);
    EXPECT_EQ(m.id, "501");
    EXPECT_EQ(m.slug, "will-it-rain");
    EXPECT_EQ(m.condition_id, "0xabc");
    ASSERT_TRUE(m.closed.has_value());
    EXPECT_TRUE(*m.closed);
    EXPECT_FALSE(m.active.has_value());

    ASSERT_EQ(m.outcomes.size(), 2u);
    EXPECT_EQ(m.outcomes[1], "No");
    ASSERT_EQ(m.outcome_prices.size(), 2u);
    EXPECT_DOUBLE_EQ(m.outcome_prices[0], 0.25);
    ASSERT_EQ(m.clob_token_ids.size(), 2u);
    EXPECT_EQ(m.clob_token_ids[1], "222");
}

TEST(GammaRest, ParseMarketRejectsNonObject) {
    EXPECT_THROW(GammaRest::parse_market(nlohmann::json::array()), std::runtime_error);
}

TEST(GammaRest, RetriesServerErrorsAndThrottling) {
    EXPECT_TRUE(GammaRest::should_retry(500));
    EXPECT_TRUE(GammaRest::should_retry(503));
    EXPECT_TRUE(GammaRest::should_retry(429));
    EXPECT_TRUE(GammaRest::should_retry(408));
    EXPECT_FALSE(GammaRest::should_retry(404));
    EXPECT_FALSE(GammaRest::should_retry(400));
}
