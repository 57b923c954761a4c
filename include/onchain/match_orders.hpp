// include/onchain/match_orders.hpp
#pragma once

#include "copytrade/types.hpp"
#include "onchain/abi.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace onchain {

// matchOrders((uint256,address,address,address,uint256,uint256,uint256,
//              uint256,uint256,uint256,uint8,uint8,bytes),
//             (...)[],uint256,uint256,uint256[],uint256,uint256[])
inline constexpr std::string_view kMatchOrdersSelector = "0x2287e350";

/// Cheap pre-filter run before the full decode. True iff `raw` is a 0x hex
/// string starting with `selector` whose lowercase form contains `needle`.
/// May give false positives, never false negatives.
bool matches_calldata(std::string_view raw,
                      std::string_view needle,
                      std::string_view selector = kMatchOrdersSelector);

/// Full ABI decode. Returns nullopt on any malformed input; never throws.
std::optional<copytrade::MatchCall> decode_match_orders(const Bytes& calldata,
                                                        std::string_view selector = kMatchOrdersSelector);

std::optional<copytrade::MatchCall> decode_match_orders(std::string_view hex,
                                                        std::string_view selector = kMatchOrdersSelector);

/// Canonical encoding (selector + arguments) as 0x hex.
std::string encode_match_orders(const copytrade::MatchCall& call,
                                std::string_view selector = kMatchOrdersSelector);

copytrade::TradeInfo infer_role_and_side(const copytrade::MatchCall& call,
                                         std::string_view target);

/// Exact shares/cash the target filled in this call, in raw units.
copytrade::FillBreakdown compute_fill_for_target(const copytrade::MatchCall& call,
                                                 std::string_view target);

} // namespace onchain
