// src/copytrade/calculator.cpp
#include "copytrade/calculator.hpp"

namespace copytrade {

namespace {

constexpr std::uint32_t kBpsDenominator = 10000;

std::optional<U256> positive_amount(const std::optional<std::string>& text)
{
    if (!text) {
        return std::nullopt;
    }
    auto v = parse_uint(*text);
    if (!v || *v == 0) {
        return std::nullopt;
    }
    return v;
}

} // namespace

std::optional<CopyIntent> build_intent(const CopyFill& fill, const CopyConfig& config)
{
    if (!config.scale.positive()) {
        return std::nullopt;
    }
    if (fill.side == Side::Unknown) {
        return std::nullopt;
    }
    if (fill.side == Side::Buy && !config.allow_buy) {
        return std::nullopt;
    }
    if (fill.side == Side::Sell && !config.allow_sell) {
        return std::nullopt;
    }

    const auto shares = positive_amount(fill.shares);
    const auto usdc   = positive_amount(fill.usdc);
    if (!shares || !usdc) {
        return std::nullopt;
    }

    // Any intermediate that does not fit in 256 bits makes the fill unusable.
    const auto copy_shares = config.scale.apply(*shares);
    const auto copy_usdc   = config.scale.apply(*usdc);
    if (!copy_shares || !copy_usdc || *copy_shares == 0 || *copy_usdc == 0) {
        return std::nullopt;
    }

    const auto implied = mul_div(*usdc, pow10(kFixedDecimals), *shares);
    if (!implied) {
        return std::nullopt;
    }
    const auto delta = mul_div(*implied, config.slippage_bps, kBpsDenominator);
    if (!delta) {
        return std::nullopt;
    }

    std::optional<U256> limit;
    if (fill.side == Side::Buy) {
        limit = checked_add(*implied, *delta);
    } else if (*delta < *implied) {
        limit = *implied - *delta;
    }
    if (!limit || *limit == 0) {
        return std::nullopt;
    }

    CopyIntent intent;
    intent.token_id      = fill.token_id;
    intent.side          = fill.side;
    intent.size          = *copy_shares;
    intent.price         = *limit;
    intent.implied_price = *implied;
    intent.notional      = *copy_usdc;
    intent.source_hash   = fill.hash;
    return intent;
}

} // namespace copytrade
