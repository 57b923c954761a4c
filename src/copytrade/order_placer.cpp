// src/copytrade/order_placer.cpp
#include "copytrade/order_placer.hpp"
#include "copytrade/fixed_point.hpp"
#include "utils/log.hpp"

#include <spdlog/spdlog.h>

#include <utility>

using nlohmann::json;

namespace copytrade {

namespace {

json intent_fields(const CopyIntent& intent)
{
    json j = {
        {"side", to_string(intent.side)},
        {"tokenId", intent.token_id},
        {"size", format_units(intent.size)},
        {"price", format_units(intent.price)},
    };
    if (intent.source_hash) {
        j["hash"] = *intent.source_hash;
    }
    return j;
}

PlacementResult skipped(const CopyIntent& intent, std::string reason)
{
    PlacementResult r;
    r.status = PlacementStatus::Skipped;
    r.intent = intent;
    r.reason = std::move(reason);
    return r;
}

} // namespace

OrderPlacer::OrderPlacer(PlacerConfig                          config,
                         exchange::ClobCredentials             credentials,
                         std::shared_ptr<exchange::OrderVenue> venue)
    : config_(config)
    , credentials_(std::move(credentials))
    , venue_(std::move(venue))
{
    live_ = !config_.simulate_only && credentials_.complete() && venue_ != nullptr;

    if (!live_) {
        spdlog::warn("copy trading in simulate-only (missing signer or API creds) {}",
                     utils::fields({{"simulateOnly", config_.simulate_only},
                                    {"hasSigner", venue_ != nullptr},
                                    {"hasPrivateKey", !credentials_.private_key.empty()},
                                    {"hasApiKey", !credentials_.api_key.empty()},
                                    {"hasApiSecret", !credentials_.api_secret.empty()},
                                    {"hasApiPassphrase", !credentials_.api_passphrase.empty()}}));
    }
}

PlacementResult OrderPlacer::place(const CopyIntent& intent) const
{
    if (!live_) {
        spdlog::info("copy simulate {}", utils::fields(intent_fields(intent)));
        PlacementResult r;
        r.status = PlacementStatus::Simulated;
        r.intent = intent;
        return r;
    }

    exchange::VenueOrder order;
    order.token_id = intent.token_id;
    order.side     = intent.side;

    if (is_market_style(config_.order_type)) {
        // BUY spends cash, SELL sells shares.
        const U256 amount = intent.side == Side::Buy ? round_to_decimals(intent.notional, 2)
                                                     : round_to_decimals(intent.size, 4);
        if (amount == 0) {
            return skipped(intent, "amount rounded to zero");
        }
        order.market = true;
        order.amount = format_units(amount);
        order.price  = format_units(intent.price);
    } else {
        const U256 price = round_to_decimals(intent.price, 4);
        const U256 size  = round_to_decimals(intent.size, 4);
        if (price == 0 || size == 0) {
            return skipped(intent, "price/size rounded to zero");
        }
        order.price = format_units(price);
        order.size  = format_units(size);
    }

    try {
        const std::string order_id = venue_->submit(order, config_.order_type);

        json meta = intent_fields(intent);
        meta["orderType"] = to_string(config_.order_type);
        spdlog::info("copy posted {}", utils::fields(meta));

        PlacementResult r;
        r.status = PlacementStatus::Posted;
        r.intent = intent;
        if (!order_id.empty()) {
            r.venue_order_id = order_id;
        }
        return r;
    } catch (const std::exception& ex) {
        json meta = intent_fields(intent);
        meta["err"] = ex.what();
        spdlog::warn("copy placement failed {}", utils::fields(meta));
        return skipped(intent, ex.what());
    }
}

} // namespace copytrade
