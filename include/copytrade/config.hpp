// include/copytrade/config.hpp
#pragma once

#include "copytrade/calculator.hpp"
#include "copytrade/order_placer.hpp"
#include "copytrade/router.hpp"
#include "exchange/clob_rest.hpp"
#include "onchain/mempool_watcher.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace copytrade {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AppConfig {
    std::string rpc_wss_url;
    std::string rpc_http_url;
    bool        use_alchemy_pending = false;

    std::vector<std::string> targets;
    std::string              trader{onchain::kDefaultTrader};
    std::string              fee_module{onchain::kFeeModuleAddress};
    std::string              selector{onchain::kMatchOrdersSelector};
    std::uint64_t            heartbeat_blocks     = 1;
    std::size_t              recent_hash_capacity = onchain::RecentHashes::kDefaultCapacity;

    std::chrono::milliseconds market_cache_ttl{60000};
    std::chrono::milliseconds market_cache_negative_ttl{10000};
    long                      http_timeout_ms = 8000;
    int                       http_retries    = 1;

    CopyConfig                copy;
    PlacerConfig              placer;
    exchange::ClobCredentials credentials;

    std::string clob_rest_url = "https://clob.polymarket.com";
    std::string gamma_api_url = "https://gamma-api.polymarket.com";
    std::string gamma_api_key;

    LogFormat   log_format = LogFormat::Json;
    bool        debug      = false;
    std::size_t worker_threads   = 4;
    std::size_t max_pending_jobs = 256;

    onchain::WatcherConfig watcher_config() const;
    RouterConfig           router_config() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Throws ConfigError when POLYGON_RPC_WSS is missing or an address is
// invalid. Other unparsable values fall back to their defaults.
AppConfig load_config(const EnvLookup& env);

AppConfig load_config_from_env();

} // namespace copytrade
