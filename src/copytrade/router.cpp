// src/copytrade/router.cpp
#include "copytrade/router.hpp"
#include "copytrade/fixed_point.hpp"
#include "onchain/match_orders.hpp"
#include "utils/log.hpp"

#include <spdlog/spdlog.h>

#include <ostream>
#include <utility>

using nlohmann::json;

namespace copytrade {

namespace {

std::string display_units(const std::optional<std::string>& raw)
{
    if (!raw) {
        return "n/a";
    }
    const auto v = parse_uint(*raw);
    return v ? format_units(*v) : *raw;
}

json base_fields(const OnchainEvent& event)
{
    json j = {{"hash", event.hash}};
    if (event.info) {
        j["role"] = to_string(event.info->role);
        j["side"] = to_string(event.info->side);
        if (event.info->token_id) j["tokenId"] = *event.info->token_id;
    }
    return j;
}

} // namespace

StrategyRouter::StrategyRouter(RouterConfig             config,
                               CopyConfig               copy,
                               const OrderPlacer&       placer,
                               utils::TaskPool&         pool,
                               exchange::MarketSource*  markets,
                               exchange::TokenResolver* tokens,
                               std::ostream&            out)
    : config_(std::move(config))
    , copy_(copy)
    , placer_(placer)
    , pool_(pool)
    , markets_(markets)
    , tokens_(tokens)
    , out_(out)
{
}

StrategyRouter::~StrategyRouter()
{
    detach();
}

void StrategyRouter::attach(EventBus& bus)
{
    detach();
    unsubscribe_ = bus.subscribe([this](const OnchainEvent& ev) { on_event(ev); });
}

void StrategyRouter::detach()
{
    if (unsubscribe_) {
        unsubscribe_();
        unsubscribe_ = nullptr;
    }
}

void StrategyRouter::set_result_listener(ResultListener listener)
{
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

CopyFill StrategyRouter::copy_fill_for(const OnchainEvent& event, const FillBreakdown& breakdown)
{
    CopyFill fill;
    fill.hash = event.hash.empty() ? std::nullopt : std::optional<std::string>(event.hash);
    if (event.info && event.info->token_id) {
        fill.token_id = *event.info->token_id;
    }

    fill.side = breakdown.side;
    if (fill.side == Side::Unknown && event.info) {
        fill.side = event.info->side;
    }

    fill.shares = breakdown.shares ? breakdown.shares
                                   : (event.taker_receive ? event.taker_receive : event.taker_fill);
    fill.usdc   = breakdown.usdc ? breakdown.usdc
                                 : (event.taker_fill ? event.taker_fill : event.taker_receive);
    return fill;
}

std::vector<std::string> StrategyRouter::format_readable_lines(const ReadableReport& r)
{
    std::string market = "Unknown market";
    if (r.market_title && !r.market_title->empty()) {
        market = *r.market_title;
    } else if (r.market_slug && !r.market_slug->empty()) {
        market = *r.market_slug;
    }

    std::string closed;
    if (r.closed) {
        closed = *r.closed ? " (closed)" : "";
    }

    std::vector<std::string> lines;
    lines.push_back(r.role + " - " + market + closed);
    lines.push_back("  " + r.side + " " + display_units(r.shares) + " shares for " +
                    display_units(r.usdc) + " USDC");
    if (!r.hash.empty()) {
        lines.push_back("  hash: " + r.hash);
    }
    return lines;
}

void StrategyRouter::on_event(const OnchainEvent& event)
{
    if (!event.info || !event.info->token_id) {
        json meta = base_fields(event);
        if (event.taker_fill)    meta["takerFill"]    = *event.taker_fill;
        if (event.taker_receive) meta["takerReceive"] = *event.taker_receive;
        spdlog::info("onchain event {}", utils::fields(meta));
        return;
    }

    FillBreakdown breakdown;
    if (event.decoded) {
        breakdown = onchain::compute_fill_for_target(*event.decoded, config_.trader);
    }
    const CopyFill fill = copy_fill_for(event, breakdown);

    if (!pool_.submit([this, fill]() { run_copy(fill); })) {
        spdlog::warn("pipeline queue full, copy dropped {}", utils::fields({{"hash", event.hash}}));
    }
    if (!pool_.submit([this, event, breakdown]() { report(event, breakdown); })) {
        spdlog::warn("pipeline queue full, report dropped {}", utils::fields({{"hash", event.hash}}));
    }
}

void StrategyRouter::run_copy(const CopyFill& fill)
{
    const auto intent = build_intent(fill, copy_);
    if (!intent) {
        spdlog::debug("no copy intent {}", utils::fields({{"hash", fill.hash ? json(*fill.hash) : json()},
                                                          {"side", to_string(fill.side)},
                                                          {"shares", fill.shares ? json(*fill.shares) : json()},
                                                          {"usdc", fill.usdc ? json(*fill.usdc) : json()}}));
        return;
    }

    const PlacementResult result = placer_.place(*intent);

    ResultListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(result);
    }
}

void StrategyRouter::report(const OnchainEvent& event, const FillBreakdown& breakdown)
{
    const std::string token_id = *event.info->token_id;

    std::optional<exchange::TokenInfo> token;
    std::optional<exchange::Market>    market;
    if (tokens_) {
        token = tokens_->resolve(token_id);
    }
    if (markets_) {
        market = markets_->resolve_by_token_id(token_id);
    }

    const auto shares = breakdown.shares ? breakdown.shares : event.taker_receive;
    const auto usdc   = breakdown.usdc ? breakdown.usdc : event.taker_fill;

    if (config_.format == LogFormat::Readable) {
        ReadableReport r;
        r.role = to_string(breakdown.role != Role::Unknown ? breakdown.role : event.info->role);
        r.side = to_string(breakdown.side != Side::Unknown ? breakdown.side : event.info->side);
        if (market) {
            r.market_title = market->question;
            r.market_slug  = market->slug;
            r.closed       = market->closed;
        }
        r.shares = shares;
        r.usdc   = usdc;
        r.hash   = event.hash;

        std::lock_guard<std::mutex> lock(out_mutex_);
        for (const auto& line : format_readable_lines(r)) {
            out_ << line << '\n';
        }
        out_.flush();
        return;
    }

    json meta = base_fields(event);
    meta["takerFill"]    = usdc ? json(*usdc) : json();
    meta["takerReceive"] = shares ? json(*shares) : json();
    if (token) {
        meta["marketId"] = token->market_id;
        meta["assetId"]  = token->asset_id;
    }
    if (market) {
        meta["marketSlug"]  = market->slug;
        meta["marketTitle"] = market->question;
        if (market->closed) meta["marketClosed"] = *market->closed;
    }
    spdlog::info("onchain event {}", utils::fields(meta));
}

} // namespace copytrade
