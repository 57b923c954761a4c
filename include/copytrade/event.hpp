#pragma once

#include "copytrade/types.hpp"

#include <optional>
#include <string>

namespace copytrade {

// Normalised pending transaction published by the mempool watcher.
// decoded/info are absent when the calldata could not be decoded; the event
// is still published so the hash stays observable.
struct OnchainEvent {
    std::string hash;
    std::string from;
    std::string to;
    std::string value;
    std::string input;

    std::optional<MatchCall> decoded;
    std::optional<TradeInfo> info;

    std::optional<std::string> taker_fill;    // decoded taker_fill_amount
    std::optional<std::string> taker_receive; // decoded taker_receive_amount
};

} // namespace copytrade
