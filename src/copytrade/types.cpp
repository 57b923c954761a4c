// src/copytrade/types.cpp
#include "copytrade/types.hpp"

namespace copytrade {

const char* to_string(Side side) noexcept
{
    switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
    default:         return "UNKNOWN";
    }
}

const char* to_string(Role role) noexcept
{
    switch (role) {
    case Role::Maker: return "MAKER";
    case Role::Taker: return "TAKER";
    default:          return "UNKNOWN";
    }
}

const char* to_string(OrderType type) noexcept
{
    switch (type) {
    case OrderType::FAK: return "FAK";
    case OrderType::FOK: return "FOK";
    case OrderType::GTC: return "GTC";
    case OrderType::GTD: return "GTD";
    }
    return "FAK";
}

const char* to_string(PlacementStatus status) noexcept
{
    switch (status) {
    case PlacementStatus::Simulated: return "simulated";
    case PlacementStatus::Posted:    return "posted";
    case PlacementStatus::Skipped:   return "skipped";
    }
    return "skipped";
}

Side side_from_wire(std::uint8_t value) noexcept
{
    if (value == 0) return Side::Buy;
    if (value == 1) return Side::Sell;
    return Side::Unknown;
}

} // namespace copytrade
