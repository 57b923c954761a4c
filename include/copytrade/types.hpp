#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace copytrade {

using U256 = boost::multiprecision::uint256_t;

enum class Side {
    Buy,
    Sell,
    Unknown
};

enum class Role {
    Maker,
    Taker,
    Unknown
};

// Venue time-in-force. FAK/FOK are market-style, GTC/GTD rest on the book.
enum class OrderType {
    FAK,
    FOK,
    GTC,
    GTD
};

const char* to_string(Side side) noexcept;
const char* to_string(Role role) noexcept;
const char* to_string(OrderType type) noexcept;

/// On-chain side encoding: 0 = BUY, 1 = SELL, anything else is unknown.
Side side_from_wire(std::uint8_t value) noexcept;

inline bool is_market_style(OrderType type) noexcept
{
    return type == OrderType::FAK || type == OrderType::FOK;
}

// One signed order inside a matchOrders call. Addresses are lowercase 0x-hex.
struct OrderLeg {
    U256         salt;
    std::string  maker;
    std::string  signer;
    std::string  taker;
    U256         token_id;
    U256         maker_amount;
    U256         taker_amount;
    U256         expiration;
    U256         nonce;
    U256         fee_rate_bps;
    std::uint8_t side           = 0;
    std::uint8_t signature_type = 0;
    std::vector<std::uint8_t> signature;
};

// maker_fill_amounts[i] belongs to maker_orders[i].
struct MatchCall {
    OrderLeg              taker_order;
    std::vector<OrderLeg> maker_orders;
    U256                  taker_fill_amount;
    U256                  taker_receive_amount;
    std::vector<U256>     maker_fill_amounts;
    U256                  taker_fee_amount;
    std::vector<U256>     maker_fee_amounts;
};

struct TradeInfo {
    Role role = Role::Unknown;
    Side side = Side::Unknown;
    std::optional<std::string> token_id;
};

// Amounts are decimal strings of raw on-chain units. An absent field means
// "could not be attributed", which is not the same as a zero fill.
struct FillBreakdown {
    Role role = Role::Unknown;
    Side side = Side::Unknown;
    std::optional<std::string> token_id;
    std::optional<std::string> shares;
    std::optional<std::string> usdc;
};

// Input of the copy calculator.
struct CopyFill {
    std::optional<std::string> hash;
    std::string                token_id;
    Side                       side = Side::Unknown;
    std::optional<std::string> shares;
    std::optional<std::string> usdc;
};

// Scaled order derived from one observed fill. Quantities are fixed-point
// integers with 6 decimals (see copytrade/fixed_point.hpp).
struct CopyIntent {
    std::string token_id;
    Side        side = Side::Buy;
    U256        size;           // shares
    U256        price;          // limit price, slippage applied
    U256        implied_price;  // cash / shares of the observed fill
    U256        notional;       // scaled cash
    std::optional<std::string> source_hash;
};

enum class PlacementStatus {
    Simulated,
    Posted,
    Skipped
};

const char* to_string(PlacementStatus status) noexcept;

struct PlacementResult {
    PlacementStatus            status = PlacementStatus::Simulated;
    CopyIntent                 intent;
    std::optional<std::string> venue_order_id; // Posted only
    std::string                reason;         // Skipped only
};

} // namespace copytrade
