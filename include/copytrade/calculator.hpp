// include/copytrade/calculator.hpp
#pragma once

#include "copytrade/fixed_point.hpp"
#include "copytrade/types.hpp"

#include <cstdint>
#include <optional>

namespace copytrade {

struct CopyConfig {
    Ratio         scale{1, 10};
    std::uint32_t slippage_bps = 500;
    bool          allow_buy    = true;
    bool          allow_sell   = true;
};

/**
 * Scale an observed fill into a copy order. Pure: the same fill and config
 * always give the same intent.
 *
 * Returns nullopt when the scale is zero, the side is unknown or not
 * allowed, either amount is missing or not a positive integer, the scaled
 * size or cash floors to zero, or slippage pushes the limit price to zero.
 *
 * BUY limit = implied * (1 + bps/10000), SELL limit = implied * (1 - bps/10000),
 * each step floored at 6 decimals.
 */
std::optional<CopyIntent> build_intent(const CopyFill& fill, const CopyConfig& config);

} // namespace copytrade
