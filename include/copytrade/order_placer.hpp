// include/copytrade/order_placer.hpp
#pragma once

#include "copytrade/types.hpp"
#include "exchange/clob_rest.hpp"
#include "exchange/order_venue.hpp"

#include <memory>

namespace copytrade {

struct PlacerConfig {
    OrderType order_type    = OrderType::FAK;
    bool      simulate_only = true;
};

// Turns one CopyIntent into at most one venue submission.
//
// Without complete credentials, without a venue, or in simulate-only mode
// every intent is reported as Simulated and nothing is sent. Otherwise the
// intent is rounded to venue precision and submitted once; failures become
// Skipped with the error text and are never retried.
class OrderPlacer {
public:
    OrderPlacer(PlacerConfig                          config,
                exchange::ClobCredentials             credentials,
                std::shared_ptr<exchange::OrderVenue> venue);

    bool live() const noexcept { return live_; }

    PlacementResult place(const CopyIntent& intent) const;

private:
    PlacerConfig                          config_;
    exchange::ClobCredentials             credentials_;
    std::shared_ptr<exchange::OrderVenue> venue_;
    bool                                  live_ = false;
};

} // namespace copytrade
