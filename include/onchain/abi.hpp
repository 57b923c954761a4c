// include/onchain/abi.hpp
#pragma once

#include "copytrade/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace onchain {

using Bytes = std::vector<std::uint8_t>;
using copytrade::U256;

/// Decode "0x"-prefixed (or bare) hex. Odd length or non-hex characters
/// return nullopt.
std::optional<Bytes> from_hex(std::string_view hex);

/// Lowercase hex with "0x" prefix.
std::string to_hex(const Bytes& bytes);

/// Lowercase copy of `text` (ASCII only).
std::string to_lower(std::string_view text);

/// "0x" + 40 hex digits, any case -> lowercase form. Anything else -> nullopt.
std::optional<std::string> normalize_address(std::string_view address);

/// Case-insensitive address equality.
bool same_address(std::string_view a, std::string_view b);

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace abi {

constexpr std::size_t kWord = 32;

// Bounds-checked view over head/tail encoded ABI data. All offsets are byte
// offsets relative to the start of the view. Every accessor throws
// DecodeError instead of reading past the end.
class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t size);

    std::size_t size() const noexcept { return size_; }

    U256          uint_at(std::size_t pos) const;
    std::uint8_t  uint8_at(std::size_t pos) const;   // rejects values > 255
    std::string   address_at(std::size_t pos) const; // rejects dirty upper bytes
    std::size_t   offset_at(std::size_t pos) const;  // word used as an offset/length

    /// `bytes` value whose tail starts at `pos`: length word then data.
    Bytes         bytes_at(std::size_t pos) const;

    /// Sub-view starting at `pos` (used for tuples and array bodies).
    Reader        sub(std::size_t pos) const;

private:
    const std::uint8_t* word_ptr(std::size_t pos) const;

    const std::uint8_t* data_;
    std::size_t         size_;
};

// Canonical head/tail encoder. Heads are appended in order; dynamic members
// are written with put_offset() and filled in later by the caller.
class Writer {
public:
    void put_uint(const U256& value);
    void put_address(std::string_view address);
    void put_offset(std::size_t offset) { put_uint(U256(offset)); }

    /// Length word followed by data right-padded to a word boundary.
    void put_bytes(const Bytes& data);

    void append(const Bytes& raw) { out_.insert(out_.end(), raw.begin(), raw.end()); }

    std::size_t  size() const noexcept { return out_.size(); }
    const Bytes& bytes() const noexcept { return out_; }

private:
    Bytes out_;
};

} // namespace abi
} // namespace onchain
