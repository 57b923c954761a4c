#include <gtest/gtest.h>

#include "copytrade/calculator.hpp"
#include "copytrade/fixed_point.hpp"

#include <limits>
#include <string>

using namespace copytrade;

namespace {

CopyFill fill_of(Side side, const char* shares, const char* usdc) {
    CopyFill f;
    f.hash     = std::string("0xabc");
    f.token_id = "12345";
    f.side     = side;
    f.shares   = std::string(shares);
    f.usdc     = std::string(usdc);
    return f;
}

CopyConfig config_of(const char* scale, std::uint32_t bps) {
    CopyConfig c;
    c.scale        = *parse_ratio(scale);
    c.slippage_bps = bps;
    return c;
}

} // namespace

// 1000 shares for 500 USDC, in 6-decimal raw units.
TEST(BuildIntent, ScalesBuyAndAppliesSlippage) {
    auto intent = build_intent(fill_of(Side::Buy, "1000000000", "500000000"), config_of("0.1", 500));
    ASSERT_TRUE(intent.has_value());

    EXPECT_EQ(format_units(intent->size), "100");
    EXPECT_EQ(format_units(intent->implied_price), "0.5");
    EXPECT_EQ(format_units(intent->price), "0.525");
    EXPECT_EQ(format_units(intent->notional), "50");
    EXPECT_EQ(intent->side, Side::Buy);
    EXPECT_EQ(intent->token_id, "12345");
    EXPECT_EQ(intent->source_hash, std::optional<std::string>("0xabc"));
}

TEST(BuildIntent, SellSlippageWorsensDownward) {
    auto intent = build_intent(fill_of(Side::Sell, "1000000000", "500000000"), config_of("0.1", 500));
    ASSERT_TRUE(intent.has_value());
    EXPECT_EQ(format_units(intent->price), "0.475");
}

TEST(BuildIntent, IsDeterministic) {
    const auto fill = fill_of(Side::Buy, "123456789", "98765432");
    const auto cfg  = config_of("0.37", 123);
    auto a = build_intent(fill, cfg);
    auto b = build_intent(fill, cfg);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->size, b->size);
    EXPECT_EQ(a->price, b->price);
    EXPECT_EQ(a->notional, b->notional);
}

TEST(BuildIntent, NullWhenScaledSizeFloorsToZero) {
    EXPECT_FALSE(build_intent(fill_of(Side::Buy, "1", "1"), config_of("0.0001", 0)).has_value());
}

TEST(BuildIntent, NullForZeroScale) {
    EXPECT_FALSE(build_intent(fill_of(Side::Buy, "1000", "1000"), config_of("0", 0)).has_value());
}

TEST(BuildIntent, NullForDisallowedSides) {
    auto cfg = config_of("1", 0);
    cfg.allow_buy = false;
    EXPECT_FALSE(build_intent(fill_of(Side::Buy, "1000", "500"), cfg).has_value());
    EXPECT_TRUE(build_intent(fill_of(Side::Sell, "1000", "500"), cfg).has_value());

    cfg.allow_buy  = true;
    cfg.allow_sell = false;
    EXPECT_FALSE(build_intent(fill_of(Side::Sell, "1000", "500"), cfg).has_value());
}

TEST(BuildIntent, NullForUnknownSide) {
    EXPECT_FALSE(build_intent(fill_of(Side::Unknown, "1000", "500"), config_of("1", 0)).has_value());
}

TEST(BuildIntent, NullForMissingOrNonPositiveAmounts) {
    auto cfg = config_of("1", 0);
    EXPECT_FALSE(build_intent(fill_of(Side::Buy, "0", "500"), cfg).has_value());
    EXPECT_FALSE(build_intent(fill_of(Side::Buy, "1000", "-5"), cfg).has_value());
    EXPECT_FALSE(build_intent(fill_of(Side::Buy, "abc", "500"), cfg).has_value());

    CopyFill f = fill_of(Side::Buy, "1000", "500");
    f.usdc.reset();
    EXPECT_FALSE(build_intent(f, cfg).has_value());
}

TEST(BuildIntent, NullWhenSellSlippageReachesZero) {
    EXPECT_FALSE(build_intent(fill_of(Side::Sell, "1000000", "500000"), config_of("1", 10000)).has_value());
    EXPECT_FALSE(build_intent(fill_of(Side::Sell, "1000000", "500000"), config_of("1", 20000)).has_value());
}

TEST(BuildIntent, ExactScaleAvoidsBinaryRounding) {
    // 0.29 * 100 is 28.999... in binary floating point
    auto intent = build_intent(fill_of(Side::Buy, "100", "100"), config_of("0.29", 0));
    ASSERT_TRUE(intent.has_value());
    EXPECT_EQ(intent->size, U256(29));
}

TEST(BuildIntent, NullWhenImpliedPriceOverflows) {
    // 2^255 USDC for one raw share: usdc * 10^6 / shares exceeds 256 bits
    const std::string huge = (U256(1) << 255).str();
    EXPECT_FALSE(build_intent(fill_of(Side::Buy, "1", huge.c_str()), config_of("1", 0)).has_value());
}

TEST(BuildIntent, NullWhenScaledAmountOverflows) {
    const std::string max = (std::numeric_limits<U256>::max)().str();
    EXPECT_FALSE(build_intent(fill_of(Side::Sell, max.c_str(), max.c_str()), config_of("2", 0)).has_value());
}

TEST(BuildIntent, NullWhenBuySlippageOverflows) {
    // one share per raw unit of cash puts the implied price at the top of the range
    const U256 max = (std::numeric_limits<U256>::max)();
    const CopyFill fill = fill_of(Side::Buy, "1000000", max.str().c_str());
    EXPECT_FALSE(build_intent(fill, config_of("1", 500)).has_value());

    auto sell = fill;
    sell.side = Side::Sell;
    auto intent = build_intent(sell, config_of("1", 500));
    ASSERT_TRUE(intent.has_value());
    EXPECT_EQ(intent->implied_price, max);
}
