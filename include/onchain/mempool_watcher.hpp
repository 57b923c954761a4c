// include/onchain/mempool_watcher.hpp
#pragma once

#include "copytrade/event.hpp"
#include "onchain/json_rpc_stream.hpp"
#include "onchain/match_orders.hpp"
#include "onchain/recent_hashes.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace onchain {

inline constexpr std::string_view kFeeModuleAddress = "0xE3f18aCc55091e2c48d883fc8C8413319d4Ab7b0";
inline constexpr std::string_view kDefaultTrader    = "0x557bEd924A1bB6F62842C5742d1dc789B8D480d4";

// How pending transactions reach us.
//  ProviderPush: alchemy_pendingTransactions, full objects filtered by `to`
//                on the provider side.
//  Standard:     newPendingTransactions hashes, each resolved with
//                eth_getTransactionByHash on the same socket.
enum class PendingMode {
    ProviderPush,
    Standard
};

const char* to_string(PendingMode mode) noexcept;

struct WatcherConfig {
    std::string              rpc_wss_url;
    PendingMode              mode = PendingMode::Standard;
    std::vector<std::string> targets;          // watched `to` addresses
    std::string              fee_module{kFeeModuleAddress};
    std::string              trader{kDefaultTrader};
    std::string              selector{kMatchOrdersSelector};
    std::uint64_t            heartbeat_blocks = 1;
    std::size_t              recent_capacity  = RecentHashes::kDefaultCapacity;
};

// Watches the pending pool for matchOrders calls that mention the trader
// and publishes one OnchainEvent per admitted transaction.
//
// Filter order per transaction: `to` in target set, selector/needle
// pre-filter, duplicate hash, then decode. Events are published even when
// decoding fails.
class MempoolWatcher {
public:
    enum class State {
        Stopped,
        Starting,
        Running,
        Stopping
    };

    using Publish     = std::function<void(const copytrade::OnchainEvent&)>;
    using RequestSink = std::function<void(const nlohmann::json&)>;

    // Throws std::invalid_argument for an invalid target, fee module or
    // trader address.
    MempoolWatcher(WatcherConfig config, Publish publish);
    ~MempoolWatcher();

    MempoolWatcher(const MempoolWatcher&)            = delete;
    MempoolWatcher& operator=(const MempoolWatcher&) = delete;

    // Open the pending and newHeads streams. No-op unless Stopped.
    void start();

    // Close both streams. Idempotent.
    void stop();

    State state() const noexcept { return state_.load(); }

    // Lowercase target set, fee module included.
    const std::unordered_set<std::string>& targets() const noexcept { return targets_; }

    nlohmann::json pending_subscription() const;
    static nlohmann::json heads_subscription();

    // Any message from the pending stream: subscription notifications (a
    // full transaction or a bare hash) and eth_getTransactionByHash replies.
    void handle_pending_message(const nlohmann::json& msg);

    // Run one transaction object through the filters. True if published.
    bool handle_pending_tx(const nlohmann::json& tx);

    void handle_heads_message(const nlohmann::json& msg);

    // True when `block` is on the heartbeat cadence (and was logged).
    bool handle_block_number(std::uint64_t block);

    // Where follow-up requests (eth_getTransactionByHash) go. start() points
    // it at the pending stream.
    void set_request_sink(RequestSink sink);

    std::uint64_t published() const noexcept { return published_.load(); }

private:
    void request_transaction(const std::string& hash);
    void on_stream_error(const std::string& stream, const std::string& what);

    WatcherConfig                   config_;
    Publish                         publish_;
    std::unordered_set<std::string> targets_;
    std::string                     trader_;
    std::string                     needle_;

    RecentHashes recent_;

    std::unique_ptr<JsonRpcStream> pending_stream_;
    std::unique_ptr<JsonRpcStream> heads_stream_;

    std::mutex  sink_mutex_;
    RequestSink sink_;

    std::mutex                 lifecycle_mutex_;
    std::atomic<State>         state_{State::Stopped};
    std::atomic<std::uint64_t> next_id_{1};
    std::atomic<std::uint64_t> published_{0};
};

} // namespace onchain
