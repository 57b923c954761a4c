#pragma once

#include "copytrade/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace copytrade {

// Internal precision: all decimal quantities are integers scaled by 10^6,
// which is also the on-chain unit of both shares and USDC.
constexpr unsigned kFixedDecimals = 6;

/// 10^decimals.
U256 pow10(unsigned decimals);

/// floor(a * b / d) with an unbounded intermediate product. d must be > 0.
/// nullopt when the quotient does not fit in 256 bits.
std::optional<U256> mul_div(const U256& a, const U256& b, const U256& d);

/// a + b, or nullopt on 256-bit overflow.
std::optional<U256> checked_add(const U256& a, const U256& b);

/// Parse a non-empty string of decimal digits. Signs, spaces, hex and
/// values wider than 256 bits are rejected.
std::optional<U256> parse_uint(std::string_view text);

/// Format raw fixed-point units as a decimal, trailing zeros trimmed:
/// format_units(525000) == "0.525", format_units(100000000) == "100".
std::string format_units(const U256& raw, unsigned decimals = kFixedDecimals);

/// Round a 6-decimal fixed-point value to `decimals` places, half up.
U256 round_to_decimals(const U256& micros, unsigned decimals);

// Exact non-negative rational, used for the copy scale so that "0.1" is
// one tenth and not the nearest binary double.
struct Ratio {
    U256 num = 0;
    U256 den = 1;

    bool positive() const { return num > 0; }

    /// floor(value * num / den), nullopt on overflow
    std::optional<U256> apply(const U256& value) const { return mul_div(value, num, den); }
};

/// Parse "0.1", "2", "1.25" or ".5" into an exact ratio. Returns nullopt for
/// anything else (negative numbers, exponents, empty input).
std::optional<Ratio> parse_ratio(std::string_view text);

} // namespace copytrade
