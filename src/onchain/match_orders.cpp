// src/onchain/match_orders.cpp
#include "onchain/match_orders.hpp"

#include "copytrade/fixed_point.hpp"

#include <algorithm>
#include <cctype>

namespace onchain {

using copytrade::FillBreakdown;
using copytrade::MatchCall;
using copytrade::OrderLeg;
using copytrade::Role;
using copytrade::Side;
using copytrade::TradeInfo;

namespace {

constexpr std::size_t kSelectorSize  = 4;
constexpr std::size_t kOrderFields   = 13;
constexpr std::size_t kMatchHeadSize = 7 * abi::kWord;

bool is_hex_digit(char c) noexcept
{
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

OrderLeg read_order(const abi::Reader& tuple)
{
    OrderLeg o;
    o.salt           = tuple.uint_at(0 * abi::kWord);
    o.maker          = tuple.address_at(1 * abi::kWord);
    o.signer         = tuple.address_at(2 * abi::kWord);
    o.taker          = tuple.address_at(3 * abi::kWord);
    o.token_id       = tuple.uint_at(4 * abi::kWord);
    o.maker_amount   = tuple.uint_at(5 * abi::kWord);
    o.taker_amount   = tuple.uint_at(6 * abi::kWord);
    o.expiration     = tuple.uint_at(7 * abi::kWord);
    o.nonce          = tuple.uint_at(8 * abi::kWord);
    o.fee_rate_bps   = tuple.uint_at(9 * abi::kWord);
    o.side           = tuple.uint8_at(10 * abi::kWord);
    o.signature_type = tuple.uint8_at(11 * abi::kWord);
    o.signature      = tuple.bytes_at(tuple.offset_at(12 * abi::kWord));
    return o;
}

std::vector<U256> read_uint_array(const abi::Reader& arr)
{
    const std::size_t n = arr.offset_at(0);
    std::vector<U256> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(arr.uint_at((i + 1) * abi::kWord));
    }
    return out;
}

std::vector<OrderLeg> read_order_array(const abi::Reader& arr)
{
    const std::size_t n = arr.offset_at(0);
    const abi::Reader body = arr.sub(abi::kWord);

    std::vector<OrderLeg> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(read_order(body.sub(body.offset_at(i * abi::kWord))));
    }
    return out;
}

Bytes encode_order(const OrderLeg& o)
{
    abi::Writer w;
    w.put_uint(o.salt);
    w.put_address(o.maker);
    w.put_address(o.signer);
    w.put_address(o.taker);
    w.put_uint(o.token_id);
    w.put_uint(o.maker_amount);
    w.put_uint(o.taker_amount);
    w.put_uint(o.expiration);
    w.put_uint(o.nonce);
    w.put_uint(o.fee_rate_bps);
    w.put_uint(o.side);
    w.put_uint(o.signature_type);
    w.put_offset(kOrderFields * abi::kWord);
    w.put_bytes(o.signature);
    return w.bytes();
}

Bytes encode_order_array(const std::vector<OrderLeg>& orders)
{
    std::vector<Bytes> tuples;
    tuples.reserve(orders.size());
    for (const auto& o : orders) tuples.push_back(encode_order(o));

    abi::Writer w;
    w.put_uint(orders.size());
    std::size_t offset = tuples.size() * abi::kWord;
    for (const auto& t : tuples) {
        w.put_offset(offset);
        offset += t.size();
    }
    for (const auto& t : tuples) w.append(t);
    return w.bytes();
}

Bytes encode_uint_array(const std::vector<U256>& values)
{
    abi::Writer w;
    w.put_uint(values.size());
    for (const auto& v : values) w.put_uint(v);
    return w.bytes();
}

// Adds `v` into a running sum. A missing term or an overflow leaves the sum
// unattributable for good.
void accumulate(std::optional<U256>& sum, const std::optional<U256>& v)
{
    if (!sum) return;
    sum = v ? copytrade::checked_add(*sum, *v) : std::nullopt;
}

std::optional<std::string> to_decimal(const std::optional<U256>& v)
{
    if (!v) return std::nullopt;
    return v->str();
}

} // namespace

bool matches_calldata(std::string_view raw, std::string_view needle, std::string_view selector)
{
    const std::string sel = to_lower(selector);
    if (raw.size() < sel.size() || sel.size() != 2 + 2 * kSelectorSize) {
        return false;
    }
    if (raw[0] != '0' || (raw[1] != 'x' && raw[1] != 'X')) {
        return false;
    }
    for (std::size_t i = 2; i < raw.size(); ++i) {
        if (!is_hex_digit(raw[i])) return false;
    }

    const std::string data = to_lower(raw);
    if (data.compare(0, sel.size(), sel) != 0) {
        return false;
    }
    return data.find(to_lower(needle)) != std::string::npos;
}

std::optional<MatchCall> decode_match_orders(const Bytes& calldata, std::string_view selector)
{
    const auto sel = from_hex(selector);
    if (!sel || sel->size() != kSelectorSize || calldata.size() < kSelectorSize) {
        return std::nullopt;
    }
    if (!std::equal(sel->begin(), sel->end(), calldata.begin())) {
        return std::nullopt;
    }

    try {
        const abi::Reader args(calldata.data() + kSelectorSize, calldata.size() - kSelectorSize);
        if (args.size() < kMatchHeadSize) {
            return std::nullopt;
        }

        MatchCall call;
        call.taker_order          = read_order(args.sub(args.offset_at(0 * abi::kWord)));
        call.maker_orders         = read_order_array(args.sub(args.offset_at(1 * abi::kWord)));
        call.taker_fill_amount    = args.uint_at(2 * abi::kWord);
        call.taker_receive_amount = args.uint_at(3 * abi::kWord);
        call.maker_fill_amounts   = read_uint_array(args.sub(args.offset_at(4 * abi::kWord)));
        call.taker_fee_amount     = args.uint_at(5 * abi::kWord);
        call.maker_fee_amounts    = read_uint_array(args.sub(args.offset_at(6 * abi::kWord)));

        if (call.maker_fill_amounts.size() != call.maker_orders.size()) {
            return std::nullopt;
        }
        return call;
    } catch (const DecodeError&) {
        return std::nullopt;
    }
}

std::optional<MatchCall> decode_match_orders(std::string_view hex, std::string_view selector)
{
    const auto bytes = from_hex(hex);
    if (!bytes) {
        return std::nullopt;
    }
    return decode_match_orders(*bytes, selector);
}

std::string encode_match_orders(const MatchCall& call, std::string_view selector)
{
    const auto sel = from_hex(selector);
    if (!sel || sel->size() != kSelectorSize) {
        throw std::invalid_argument("invalid selector " + std::string(selector));
    }

    const Bytes taker  = encode_order(call.taker_order);
    const Bytes makers = encode_order_array(call.maker_orders);
    const Bytes fills  = encode_uint_array(call.maker_fill_amounts);
    const Bytes fees   = encode_uint_array(call.maker_fee_amounts);

    abi::Writer w;
    w.append(*sel);

    std::size_t offset = kMatchHeadSize;
    w.put_offset(offset);
    offset += taker.size();
    w.put_offset(offset);
    offset += makers.size();
    w.put_uint(call.taker_fill_amount);
    w.put_uint(call.taker_receive_amount);
    w.put_offset(offset);
    offset += fills.size();
    w.put_uint(call.taker_fee_amount);
    w.put_offset(offset);

    w.append(taker);
    w.append(makers);
    w.append(fills);
    w.append(fees);
    return to_hex(w.bytes());
}

TradeInfo infer_role_and_side(const MatchCall& call, std::string_view target)
{
    TradeInfo info;

    const auto& taker = call.taker_order;
    if (same_address(taker.maker, target) || same_address(taker.signer, target)) {
        info.role = Role::Taker;
    } else {
        for (const auto& m : call.maker_orders) {
            if (same_address(m.maker, target)) {
                info.role = Role::Maker;
                break;
            }
        }
    }

    info.side = copytrade::side_from_wire(taker.side);
    if (taker.token_id != 0) {
        info.token_id = taker.token_id.str();
    }
    return info;
}

FillBreakdown compute_fill_for_target(const MatchCall& call, std::string_view target)
{
    const TradeInfo info = infer_role_and_side(call, target);

    FillBreakdown out;
    out.role     = info.role;
    out.side     = info.side;
    out.token_id = info.token_id;

    std::optional<U256> shares;
    std::optional<U256> usdc;

    if (info.role == Role::Taker) {
        // The decoded receive amount is reported as is, zero included.
        if (info.side == Side::Buy) {
            usdc   = call.taker_fill_amount;
            shares = call.taker_receive_amount;
        } else if (info.side == Side::Sell) {
            shares = call.taker_fill_amount;
            usdc   = call.taker_receive_amount;
        }
    } else if (info.role == Role::Maker) {
        std::optional<U256> shares_sum = U256(0);
        std::optional<U256> usdc_sum   = U256(0);

        for (std::size_t i = 0; i < call.maker_orders.size(); ++i) {
            const auto& leg = call.maker_orders[i];
            if (!same_address(leg.maker, target) || i >= call.maker_fill_amounts.size()) {
                continue;
            }
            const U256& fill = call.maker_fill_amounts[i];
            const Side leg_side = copytrade::side_from_wire(leg.side);

            if (leg.maker_amount == 0 || leg.taker_amount == 0) {
                // No ratio: the fill is the only amount we know.
                if (leg_side == Side::Sell) accumulate(shares_sum, fill);
                if (leg_side == Side::Buy)  accumulate(usdc_sum, fill);
                continue;
            }

            const auto other = copytrade::mul_div(fill, leg.taker_amount, leg.maker_amount);
            if (leg_side == Side::Buy) {
                // Maker pays cash (makerAmount), receives shares (takerAmount).
                accumulate(usdc_sum, fill);
                accumulate(shares_sum, other);
            } else if (leg_side == Side::Sell) {
                // Maker sells shares (makerAmount), receives cash (takerAmount).
                accumulate(shares_sum, fill);
                accumulate(usdc_sum, other);
            }
        }

        if (shares_sum && *shares_sum > 0) shares = shares_sum;
        if (usdc_sum && *usdc_sum > 0)     usdc   = usdc_sum;
    }

    out.shares = to_decimal(shares);
    out.usdc   = to_decimal(usdc);
    return out;
}

} // namespace onchain
