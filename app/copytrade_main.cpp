// app/copytrade_main.cpp
#include "copytrade/config.hpp"
#include "copytrade/event_bus.hpp"
#include "copytrade/order_placer.hpp"
#include "copytrade/router.hpp"
#include "exchange/clob_rest.hpp"
#include "exchange/gamma_rest.hpp"
#include "exchange/market_resolver.hpp"
#include "onchain/mempool_watcher.hpp"
#include "utils/log.hpp"
#include "utils/task_pool.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int)
{
    g_stop = true;
}

// Joins the pool workers on every exit path, before the router their queued
// jobs point at goes away.
class PoolDrain {
public:
    explicit PoolDrain(utils::TaskPool& pool) : pool_(pool) {}
    ~PoolDrain() { pool_.shutdown(); }

    PoolDrain(const PoolDrain&)            = delete;
    PoolDrain& operator=(const PoolDrain&) = delete;

private:
    utils::TaskPool& pool_;
};

} // namespace

int main()
{
    copytrade::AppConfig config;
    try {
        config = copytrade::load_config_from_env();
    } catch (const copytrade::ConfigError& ex) {
        std::cerr << "[copytrade] config error: " << ex.what() << "\n";
        return 1;
    }

    utils::init_logging(config.debug);
    spdlog::info("pending mode {}", utils::fields({{"mode", config.use_alchemy_pending ? "alchemy" : "standard"}}));

    try {
        auto gamma = std::make_shared<const exchange::GammaRest>(
            config.gamma_api_url, config.gamma_api_key, config.http_timeout_ms, config.http_retries);
        exchange::MarketResolver markets(exchange::MarketResolver::from_gamma(gamma),
                                         config.market_cache_ttl,
                                         config.market_cache_negative_ttl);

        auto clob = std::make_shared<const exchange::ClobRest>(config.clob_rest_url, config.http_timeout_ms);
        exchange::TokenResolver tokens(exchange::TokenResolver::from_clob(clob),
                                       config.market_cache_ttl,
                                       config.market_cache_negative_ttl);

        // No order signer is linked into this binary, so there is no venue and
        // every copy is simulated.
        copytrade::OrderPlacer placer(config.placer, config.credentials, nullptr);

        utils::TaskPool pool(config.worker_threads, config.max_pending_jobs);
        copytrade::EventBus bus;

        copytrade::StrategyRouter router(config.router_config(), config.copy, placer, pool,
                                         &markets, &tokens, std::cout);
        router.attach(bus);
        PoolDrain drain(pool);

        onchain::MempoolWatcher watcher(config.watcher_config(),
                                        [&bus](const copytrade::OnchainEvent& ev) { bus.publish(ev); });

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        watcher.start();
        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("shutting down");
        watcher.stop();
        router.detach();
        pool.shutdown();
    } catch (const std::exception& ex) {
        spdlog::error("fatal {}", utils::fields({{"err", ex.what()}}));
        return 1;
    }

    return 0;
}
