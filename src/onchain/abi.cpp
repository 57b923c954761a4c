// src/onchain/abi.cpp
#include "onchain/abi.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>

namespace onchain {

namespace {

int hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view strip_0x(std::string_view hex) noexcept
{
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    return hex;
}

} // namespace

std::optional<Bytes> from_hex(std::string_view hex)
{
    hex = strip_0x(hex);
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hex_value(hex[i]);
        const int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string to_hex(const Bytes& bytes)
{
    static constexpr char kDigits[] = "0123456789abcdef";

    std::string out;
    out.reserve(2 + bytes.size() * 2);
    out += "0x";
    for (std::uint8_t b : bytes) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0f];
    }
    return out;
}

std::string to_lower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::optional<std::string> normalize_address(std::string_view address)
{
    if (address.size() != 42 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
        return std::nullopt;
    }
    for (std::size_t i = 2; i < address.size(); ++i) {
        if (hex_value(address[i]) < 0) return std::nullopt;
    }
    std::string out = to_lower(address);
    out[1] = 'x';
    return out;
}

bool same_address(std::string_view a, std::string_view b)
{
    if (a.size() != b.size() || a.empty()) return false;
    return to_lower(a) == to_lower(b);
}

namespace abi {

Reader::Reader(const std::uint8_t* data, std::size_t size)
    : data_(data)
    , size_(size)
{
}

const std::uint8_t* Reader::word_ptr(std::size_t pos) const
{
    if (pos > size_ || size_ - pos < kWord) {
        throw DecodeError("abi: read past end at offset " + std::to_string(pos));
    }
    return data_ + pos;
}

U256 Reader::uint_at(std::size_t pos) const
{
    const std::uint8_t* p = word_ptr(pos);
    U256 value;
    boost::multiprecision::import_bits(value, p, p + kWord);
    return value;
}

std::uint8_t Reader::uint8_at(std::size_t pos) const
{
    const std::uint8_t* p = word_ptr(pos);
    for (std::size_t i = 0; i + 1 < kWord; ++i) {
        if (p[i] != 0) throw DecodeError("abi: uint8 out of range");
    }
    return p[kWord - 1];
}

std::string Reader::address_at(std::size_t pos) const
{
    const std::uint8_t* p = word_ptr(pos);
    for (std::size_t i = 0; i < 12; ++i) {
        if (p[i] != 0) throw DecodeError("abi: dirty address word");
    }
    return to_hex(Bytes(p + 12, p + kWord));
}

std::size_t Reader::offset_at(std::size_t pos) const
{
    const U256 value = uint_at(pos);
    if (value > size_) {
        throw DecodeError("abi: offset/length out of range");
    }
    return static_cast<std::size_t>(value);
}

Bytes Reader::bytes_at(std::size_t pos) const
{
    const std::size_t len = offset_at(pos);
    const std::size_t start = pos + kWord;
    if (start > size_ || size_ - start < len) {
        throw DecodeError("abi: bytes exceed data");
    }
    return Bytes(data_ + start, data_ + start + len);
}

Reader Reader::sub(std::size_t pos) const
{
    if (pos > size_) {
        throw DecodeError("abi: sub-view out of range");
    }
    return Reader(data_ + pos, size_ - pos);
}

void Writer::put_uint(const U256& value)
{
    Bytes word;
    boost::multiprecision::export_bits(value, std::back_inserter(word), 8);
    // export_bits emits the minimal big-endian form; left-pad to a full word.
    out_.insert(out_.end(), kWord - word.size(), 0);
    out_.insert(out_.end(), word.begin(), word.end());
}

void Writer::put_address(std::string_view address)
{
    const auto raw = from_hex(address);
    if (!raw || raw->size() != 20) {
        throw std::invalid_argument("abi: invalid address " + std::string(address));
    }
    out_.insert(out_.end(), 12, 0);
    out_.insert(out_.end(), raw->begin(), raw->end());
}

void Writer::put_bytes(const Bytes& data)
{
    put_uint(U256(data.size()));
    out_.insert(out_.end(), data.begin(), data.end());
    const std::size_t pad = (kWord - data.size() % kWord) % kWord;
    out_.insert(out_.end(), pad, 0);
}

} // namespace abi
} // namespace onchain
