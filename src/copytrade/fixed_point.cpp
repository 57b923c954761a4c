// src/copytrade/fixed_point.cpp
#include "copytrade/fixed_point.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <cctype>
#include <limits>

namespace copytrade {

namespace mp = boost::multiprecision;

namespace {

constexpr std::size_t kMaxUint256Digits = 78;

const mp::cpp_int kMaxU256 = mp::cpp_int((std::numeric_limits<U256>::max)());

bool all_digits(std::string_view text)
{
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// cpp_int's string constructor reads a leading 0 as octal, so build the value
// digit by digit instead.
mp::cpp_int from_decimal(std::string_view digits)
{
    mp::cpp_int value = 0;
    for (char c : digits) {
        value *= 10;
        value += c - '0';
    }
    return value;
}

} // namespace

U256 pow10(unsigned decimals)
{
    U256 result = 1;
    for (unsigned i = 0; i < decimals; ++i) result *= 10;
    return result;
}

std::optional<U256> mul_div(const U256& a, const U256& b, const U256& d)
{
    mp::cpp_int product = mp::cpp_int(a) * mp::cpp_int(b);
    product /= mp::cpp_int(d);
    if (product > kMaxU256) {
        return std::nullopt;
    }
    return U256(product);
}

std::optional<U256> checked_add(const U256& a, const U256& b)
{
    if (a > (std::numeric_limits<U256>::max)() - b) {
        return std::nullopt;
    }
    return a + b;
}

std::optional<U256> parse_uint(std::string_view text)
{
    if (text.empty() || text.size() > kMaxUint256Digits || !all_digits(text)) {
        return std::nullopt;
    }

    const mp::cpp_int value = from_decimal(text);
    if (value > kMaxU256) {
        return std::nullopt;
    }
    return U256(value);
}

std::string format_units(const U256& raw, unsigned decimals)
{
    const U256 base = pow10(decimals);
    const U256 int_part  = raw / base;
    const U256 frac_part = raw % base;

    std::string out = int_part.str();
    if (frac_part == 0) {
        return out;
    }

    std::string frac = frac_part.str();
    frac.insert(0, decimals - frac.size(), '0');
    while (!frac.empty() && frac.back() == '0') frac.pop_back();

    out += '.';
    out += frac;
    return out;
}

U256 round_to_decimals(const U256& micros, unsigned decimals)
{
    if (decimals >= kFixedDecimals) {
        return micros;
    }
    const U256 step    = pow10(kFixedDecimals - decimals);
    const U256 floored = micros / step * step;
    // rounding up past the top of the range keeps the floor
    if (micros % step >= step / 2 && floored <= (std::numeric_limits<U256>::max)() - step) {
        return floored + step;
    }
    return floored;
}

std::optional<Ratio> parse_ratio(std::string_view text)
{
    if (text.empty()) {
        return std::nullopt;
    }

    const auto dot = text.find('.');
    std::string_view int_part  = text.substr(0, dot);
    std::string_view frac_part = dot == std::string_view::npos
                                     ? std::string_view{}
                                     : text.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) return std::nullopt;
    if (!all_digits(int_part) || !all_digits(frac_part)) return std::nullopt;
    if (int_part.size() + frac_part.size() > kMaxUint256Digits - 1) return std::nullopt;

    std::string digits(int_part);
    digits += frac_part;

    Ratio r;
    r.num = U256(from_decimal(digits));
    r.den = pow10(static_cast<unsigned>(frac_part.size()));
    return r;
}

} // namespace copytrade
