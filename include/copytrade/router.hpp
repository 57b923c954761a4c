// include/copytrade/router.hpp
#pragma once

#include "copytrade/calculator.hpp"
#include "copytrade/event_bus.hpp"
#include "copytrade/order_placer.hpp"
#include "exchange/clob_rest.hpp"
#include "exchange/market_resolver.hpp"
#include "onchain/mempool_watcher.hpp"
#include "utils/task_pool.hpp"

#include <functional>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace copytrade {

enum class LogFormat {
    Json,
    Readable
};

struct RouterConfig {
    std::string trader{onchain::kDefaultTrader};
    LogFormat   format = LogFormat::Json;
};

// Inputs of the three-line operator report.
struct ReadableReport {
    std::string                role;
    std::string                side;
    std::optional<std::string> market_title;
    std::optional<std::string> market_slug;
    std::optional<bool>        closed;
    std::optional<std::string> shares; // raw units
    std::optional<std::string> usdc;   // raw units
    std::string                hash;
};

// Strategy attached to the bus.
//
// For every event carrying a token id two jobs go to the pool: the copy
// pipeline (fill -> intent -> placement) and the report (token and market
// lookups, then one log line or the operator lines). The bus thread only
// computes the fill breakdown and enqueues. When the pool is full the event
// is dropped with a warning.
class StrategyRouter {
public:
    using ResultListener = std::function<void(const PlacementResult&)>;

    StrategyRouter(RouterConfig             config,
                   CopyConfig               copy,
                   const OrderPlacer&       placer,
                   utils::TaskPool&         pool,
                   exchange::MarketSource*  markets,
                   exchange::TokenResolver* tokens,
                   std::ostream&            out);
    ~StrategyRouter();

    StrategyRouter(const StrategyRouter&)            = delete;
    StrategyRouter& operator=(const StrategyRouter&) = delete;

    void attach(EventBus& bus);
    void detach();

    // Called on the publishing thread.
    void on_event(const OnchainEvent& event);

    // Called from pool workers after every placement decision.
    void set_result_listener(ResultListener listener);

    // Fill handed to the calculator: the trader's own breakdown where it
    // could be attributed, the taker amounts otherwise.
    static CopyFill copy_fill_for(const OnchainEvent& event, const FillBreakdown& breakdown);

    // "ROLE - market (closed)", "  SIDE x shares for y USDC", "  hash: ..."
    static std::vector<std::string> format_readable_lines(const ReadableReport& report);

private:
    void run_copy(const CopyFill& fill);
    void report(const OnchainEvent& event, const FillBreakdown& breakdown);

    RouterConfig             config_;
    CopyConfig               copy_;
    const OrderPlacer&       placer_;
    utils::TaskPool&         pool_;
    exchange::MarketSource*  markets_;
    exchange::TokenResolver* tokens_;
    std::ostream&            out_;

    std::mutex               out_mutex_;
    std::mutex               listener_mutex_;
    ResultListener           listener_;
    EventBus::Unsubscribe    unsubscribe_;
};

} // namespace copytrade
