// tests/fake_venue.hpp
#pragma once

#include "exchange/order_venue.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace testutil {

// Records submissions; optionally rejects them.
class FakeVenue : public exchange::OrderVenue {
public:
    std::string submit(const exchange::VenueOrder& order, copytrade::OrderType type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        orders_.push_back(order);
        types_.push_back(type);
        if (!reject_with_.empty()) {
            throw std::runtime_error(reject_with_);
        }
        return order_id_;
    }

    void reject_with(std::string msg) { reject_with_ = std::move(msg); }
    void set_order_id(std::string id) { order_id_ = std::move(id); }

    std::vector<exchange::VenueOrder> orders() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_;
    }
    std::vector<copytrade::OrderType> types() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return types_;
    }

private:
    mutable std::mutex                mutex_;
    std::vector<exchange::VenueOrder> orders_;
    std::vector<copytrade::OrderType> types_;
    std::string                       reject_with_;
    std::string                       order_id_ = "0xorder";
};

inline exchange::ClobCredentials full_credentials() {
    exchange::ClobCredentials c;
    c.private_key     = "0x01";
    c.api_key         = "key";
    c.api_secret      = "c2VjcmV0LXNlY3JldC1zZWNyZXQ=";
    c.api_passphrase  = "pass";
    c.funding_address = "0x3333333333333333333333333333333333333333";
    return c;
}

} // namespace testutil
