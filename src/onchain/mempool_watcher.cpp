// src/onchain/mempool_watcher.cpp
#include "onchain/mempool_watcher.hpp"
#include "utils/log.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

using nlohmann::json;

namespace onchain {

namespace {

std::string string_member(const json& j, const char* key)
{
    if (j.is_object() && j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return {};
}

std::string require_address(const std::string& raw, const char* what)
{
    auto addr = normalize_address(raw);
    if (!addr) {
        throw std::invalid_argument(std::string("invalid ") + what + " address: " + raw);
    }
    return *addr;
}

} // namespace

const char* to_string(PendingMode mode) noexcept
{
    switch (mode) {
    case PendingMode::ProviderPush: return "alchemy";
    case PendingMode::Standard:     return "standard";
    }
    return "standard";
}

MempoolWatcher::MempoolWatcher(WatcherConfig config, Publish publish)
    : config_(std::move(config))
    , publish_(std::move(publish))
    , recent_(config_.recent_capacity)
{
    targets_.insert(require_address(config_.fee_module, "fee module"));
    for (const auto& t : config_.targets) {
        targets_.insert(require_address(t, "target"));
    }
    trader_ = require_address(config_.trader, "trader");
    needle_ = trader_.substr(2);

    if (config_.heartbeat_blocks == 0) {
        config_.heartbeat_blocks = 1;
    }
}

MempoolWatcher::~MempoolWatcher()
{
    stop();
}

json MempoolWatcher::pending_subscription() const
{
    if (config_.mode == PendingMode::ProviderPush) {
        json to_address = json::array();
        for (const auto& t : targets_) {
            to_address.push_back(t);
        }
        return make_rpc_request(0, "eth_subscribe",
                                json::array({"alchemy_pendingTransactions",
                                             {{"toAddress", to_address}, {"hashesOnly", false}}}));
    }
    return make_rpc_request(0, "eth_subscribe", json::array({"newPendingTransactions"}));
}

json MempoolWatcher::heads_subscription()
{
    return make_rpc_request(0, "eth_subscribe", json::array({"newHeads"}));
}

void MempoolWatcher::start()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    State expected = State::Stopped;
    if (!state_.compare_exchange_strong(expected, State::Starting)) {
        return;
    }

    WsEndpoint endpoint;
    try {
        endpoint = parse_ws_url(config_.rpc_wss_url);
    } catch (const std::invalid_argument&) {
        state_ = State::Stopped;
        throw;
    }

    pending_stream_ = std::make_unique<JsonRpcStream>("pending", endpoint);
    heads_stream_   = std::make_unique<JsonRpcStream>("heads", endpoint);

    JsonRpcStream* pending = pending_stream_.get();
    set_request_sink([pending](const json& req) { pending->send(req); });

    pending_stream_->start(
        pending_subscription(),
        [this](const json& msg) { handle_pending_message(msg); },
        [this](const std::string& what) { on_stream_error("pending", what); });

    heads_stream_->start(
        heads_subscription(),
        [this](const json& msg) { handle_heads_message(msg); },
        [this](const std::string& what) { on_stream_error("heads", what); });

    state_ = State::Running;
    spdlog::info("onchain watcher started {}",
                 utils::fields({{"mode", to_string(config_.mode)}, {"targets", targets_.size()}}));
}

void MempoolWatcher::stop()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    State expected = State::Running;
    if (!state_.compare_exchange_strong(expected, State::Stopping)) {
        return;
    }

    set_request_sink(nullptr);
    if (pending_stream_) {
        pending_stream_->stop();
    }
    if (heads_stream_) {
        heads_stream_->stop();
    }
    pending_stream_.reset();
    heads_stream_.reset();

    state_ = State::Stopped;
    spdlog::info("onchain watcher stopped");
}

void MempoolWatcher::set_request_sink(RequestSink sink)
{
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void MempoolWatcher::request_transaction(const std::string& hash)
{
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!sink_) {
        return;
    }
    sink_(make_rpc_request(next_id_++, "eth_getTransactionByHash", json::array({hash})));
}

void MempoolWatcher::handle_pending_message(const json& msg)
{
    if (!msg.is_object()) {
        return;
    }

    if (msg.contains("error")) {
        spdlog::warn("pending tx watcher error {}", utils::fields({{"err", msg.at("error").dump()}}));
        return;
    }

    if (string_member(msg, "method") == "eth_subscription") {
        const json& params = msg.value("params", json::object());
        if (!params.is_object() || !params.contains("result")) {
            return;
        }
        const json& result = params.at("result");
        if (result.is_object()) {
            handle_pending_tx(result);
        } else if (result.is_string()) {
            request_transaction(result.get<std::string>());
        }
        return;
    }

    // eth_getTransactionByHash reply; subscription acks carry a string and
    // dropped transactions a null result.
    if (msg.contains("result") && msg.at("result").is_object()) {
        handle_pending_tx(msg.at("result"));
    }
}

bool MempoolWatcher::handle_pending_tx(const json& tx)
{
    const auto to = normalize_address(string_member(tx, "to"));
    if (!to || targets_.count(*to) == 0) {
        return false;
    }

    std::string input = string_member(tx, "input");
    if (input.empty()) {
        input = string_member(tx, "data");
    }
    if (!matches_calldata(input, needle_, config_.selector)) {
        return false;
    }

    const std::string hash = string_member(tx, "hash");
    if (recent_.seen(hash)) {
        return false;
    }

    copytrade::OnchainEvent ev;
    ev.hash    = hash;
    ev.from    = to_lower(string_member(tx, "from"));
    ev.to      = *to;
    ev.value   = string_member(tx, "value");
    ev.input   = input;
    ev.decoded = decode_match_orders(std::string_view(input), config_.selector);
    if (ev.decoded) {
        ev.info          = infer_role_and_side(*ev.decoded, trader_);
        ev.taker_fill    = ev.decoded->taker_fill_amount.str();
        ev.taker_receive = ev.decoded->taker_receive_amount.str();
    } else {
        spdlog::debug("matchOrders decode failed {}", utils::fields({{"hash", hash}}));
    }

    json meta = {{"hash", hash}};
    if (ev.info) {
        meta["role"] = copytrade::to_string(ev.info->role);
        meta["side"] = copytrade::to_string(ev.info->side);
        if (ev.info->token_id) meta["tokenId"] = *ev.info->token_id;
    }
    if (ev.taker_fill)    meta["takerFill"]    = *ev.taker_fill;
    if (ev.taker_receive) meta["takerReceive"] = *ev.taker_receive;
    spdlog::info("pending tx to target {}", utils::fields(meta));

    ++published_;
    if (publish_) {
        publish_(ev);
    }
    return true;
}

void MempoolWatcher::handle_heads_message(const json& msg)
{
    if (!msg.is_object() || string_member(msg, "method") != "eth_subscription") {
        return;
    }
    const json& params = msg.value("params", json::object());
    const json  head   = params.is_object() ? params.value("result", json::object()) : json::object();
    const std::string number = string_member(head, "number");
    if (number.empty()) {
        return;
    }

    try {
        handle_block_number(std::stoull(number, nullptr, 16));
    } catch (const std::exception& ex) {
        spdlog::warn("onchain block watcher error {}", utils::fields({{"err", ex.what()}, {"number", number}}));
    }
}

bool MempoolWatcher::handle_block_number(std::uint64_t block)
{
    if (block % config_.heartbeat_blocks != 0) {
        return false;
    }
    spdlog::info("onchain heartbeat {}", utils::fields({{"block", std::to_string(block)}}));
    return true;
}

void MempoolWatcher::on_stream_error(const std::string& stream, const std::string& what)
{
    const std::string meta = utils::fields({{"stream", stream}, {"err", what}});
    if (stream == "heads") {
        spdlog::warn("onchain block watcher error {}", meta);
    } else {
        spdlog::warn("pending tx watcher error {}", meta);
    }
}

} // namespace onchain
