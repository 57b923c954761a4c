// include/exchange/order_venue.hpp
#pragma once

#include "copytrade/types.hpp"

#include <string>

namespace exchange {

// Order as handed to the venue, already rounded to venue precision.
// Market-style orders carry `amount` (cash for BUY, shares for SELL);
// resting orders carry `size`. `price` is always the limit.
struct VenueOrder {
    std::string     token_id;
    copytrade::Side side = copytrade::Side::Buy;
    std::string     price;
    std::string     size;
    std::string     amount;
    bool            market = false;
};

// Signer + submitter. submit() returns the venue order id (possibly empty)
// and throws on rejection or transport failure.
class OrderVenue {
public:
    virtual ~OrderVenue() = default;
    virtual std::string submit(const VenueOrder& order, copytrade::OrderType type) = 0;
};

} // namespace exchange
