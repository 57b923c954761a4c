#include <gtest/gtest.h>

#include "copytrade/event_bus.hpp"
#include "copytrade/router.hpp"
#include "fake_venue.hpp"
#include "onchain/mempool_watcher.hpp"
#include "test_fixtures.hpp"

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

using namespace copytrade;
using namespace testutil;

namespace {

// Watcher -> bus -> router -> pool -> placer -> venue, without sockets.
struct Pipeline {
    explicit Pipeline(CopyConfig copy)
        : venue(std::make_shared<FakeVenue>())
        , placer(PlacerConfig{OrderType::GTC, false}, full_credentials(), venue)
        , pool(1, 16)
        , router(RouterConfig{kTrader, LogFormat::Json}, copy, placer, pool, nullptr, nullptr, out)
        , watcher(make_watcher_config(), [this](const OnchainEvent& ev) { bus.publish(ev); })
    {
        router.attach(bus);
        router.set_result_listener([this](const PlacementResult& r) {
            std::lock_guard<std::mutex> lock(mutex);
            results.push_back(r);
        });
    }

    // Workers may still be running jobs that reach router and results.
    ~Pipeline() { drain(); }

    static onchain::WatcherConfig make_watcher_config() {
        onchain::WatcherConfig c;
        c.rpc_wss_url = "wss://node.example/ws";
        c.targets     = {kExchange};
        c.trader      = kTrader;
        return c;
    }

    void drain() {
        router.detach();
        pool.shutdown();
    }

    std::ostringstream         out;
    std::shared_ptr<FakeVenue> venue;
    OrderPlacer                placer;
    utils::TaskPool            pool;
    EventBus                   bus;
    StrategyRouter             router;
    onchain::MempoolWatcher    watcher;

    std::mutex                   mutex;
    std::vector<PlacementResult> results;
};

// Trader rests a BUY for 100 shares at 0.5 and is filled for 50 USDC.
std::string maker_buy_calldata() {
    auto call = make_call(make_leg(kOther, kBuy, 50000000, 100000000),
                          {make_leg(kTrader, kBuy, 50000000, 100000000)},
                          50000000, 100000000, {U256(50000000)});
    return onchain::encode_match_orders(call);
}

} // namespace

TEST(EndToEnd, PendingFillBecomesScaledVenueOrder) {
    CopyConfig copy;
    copy.scale        = Ratio{1, 5};
    copy.slippage_bps = 0;
    Pipeline p(copy);

    ASSERT_TRUE(p.watcher.handle_pending_tx(make_tx("0xe2e", kExchange, maker_buy_calldata())));
    // the same hash again is dropped before decoding
    EXPECT_FALSE(p.watcher.handle_pending_tx(make_tx("0xe2e", kExchange, maker_buy_calldata())));
    p.drain();

    const auto orders = p.venue->orders();
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].token_id, "12345");
    EXPECT_EQ(orders[0].side, Side::Buy);
    EXPECT_EQ(orders[0].price, "0.5");
    EXPECT_EQ(orders[0].size, "20");
    EXPECT_FALSE(orders[0].market);
    EXPECT_EQ(p.venue->types()[0], OrderType::GTC);

    ASSERT_EQ(p.results.size(), 1u);
    EXPECT_EQ(p.results[0].status, PlacementStatus::Posted);
    EXPECT_EQ(p.results[0].venue_order_id, std::optional<std::string>("0xorder"));
    EXPECT_EQ(p.results[0].intent.source_hash, std::optional<std::string>("0xe2e"));
}

TEST(EndToEnd, DisabledSideIsNotCopied) {
    CopyConfig copy;
    copy.allow_buy = false;
    Pipeline p(copy);

    ASSERT_TRUE(p.watcher.handle_pending_tx(make_tx("0xe2f", kExchange, maker_buy_calldata())));
    p.drain();

    EXPECT_TRUE(p.venue->orders().empty());
    EXPECT_TRUE(p.results.empty());
}

TEST(EndToEnd, VenueRejectionIsReportedAsSkipped) {
    CopyConfig copy;
    copy.slippage_bps = 0;
    Pipeline p(copy);
    p.venue->reject_with("not enough balance");

    ASSERT_TRUE(p.watcher.handle_pending_tx(make_tx("0xe30", kExchange, maker_buy_calldata())));
    p.drain();

    ASSERT_EQ(p.results.size(), 1u);
    EXPECT_EQ(p.results[0].status, PlacementStatus::Skipped);
    EXPECT_NE(p.results[0].reason.find("not enough balance"), std::string::npos);
    EXPECT_EQ(p.venue->orders().size(), 1u);
}

TEST(EndToEnd, TeardownFinishesQueuedJobs) {
    CopyConfig copy;
    copy.slippage_bps = 0;
    std::shared_ptr<FakeVenue> venue;
    {
        Pipeline p(copy);
        venue = p.venue;
        ASSERT_TRUE(p.watcher.handle_pending_tx(make_tx("0xe31", kExchange, maker_buy_calldata())));
    }
    EXPECT_EQ(venue->orders().size(), 1u);
}
