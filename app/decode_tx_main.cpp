// app/decode_tx_main.cpp
//
// decode_tx <txHash> [trader]
// Fetch one transaction over HTTP JSON-RPC, decode its matchOrders calldata
// and print the trader's fill the way the service reports it.
#include "copytrade/config.hpp"
#include "copytrade/fixed_point.hpp"
#include "copytrade/router.hpp"
#include "exchange/clob_rest.hpp"
#include "exchange/gamma_rest.hpp"
#include "exchange/market_resolver.hpp"
#include "onchain/json_rpc_stream.hpp"
#include "onchain/match_orders.hpp"
#include "utils/http_client.hpp"
#include "utils/log.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>

using nlohmann::json;

int main(int argc, char** argv)
{
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <txHash> [trader]\n";
        return 1;
    }
    const std::string hash = argv[1];

    copytrade::AppConfig config;
    try {
        config = copytrade::load_config_from_env();
    } catch (const copytrade::ConfigError& ex) {
        std::cerr << "[decode_tx] config error: " << ex.what() << "\n";
        return 1;
    }
    utils::init_logging(config.debug);

    std::string trader = config.trader;
    if (argc > 2) {
        auto addr = onchain::normalize_address(argv[2]);
        if (!addr) {
            std::cerr << "[decode_tx] invalid trader address: " << argv[2] << "\n";
            return 1;
        }
        trader = *addr;
    }

    try {
        spdlog::info("Fetching transaction {}", utils::fields({{"hash", hash}}));

        utils::HttpClient rpc(config.rpc_http_url, config.http_timeout_ms);
        const json req   = onchain::make_rpc_request(1, "eth_getTransactionByHash", json::array({hash}));
        const json reply = json::parse(rpc.post("", req.dump()));

        if (reply.contains("error")) {
            spdlog::error("rpc error {}", utils::fields({{"hash", hash}, {"err", reply.at("error").dump()}}));
            return 1;
        }
        const json tx = reply.value("result", json());
        if (!tx.is_object()) {
            spdlog::error("Transaction not found {}", utils::fields({{"hash", hash}}));
            return 1;
        }

        std::string input = tx.value("input", std::string());
        if (input.empty()) {
            input = tx.value("data", std::string());
        }

        const auto decoded = onchain::decode_match_orders(std::string_view(input), config.selector);
        if (!decoded) {
            spdlog::warn("not a matchOrders call {}", utils::fields({{"hash", hash}, {"to", tx.value("to", "")}}));
            return 1;
        }

        const auto info      = onchain::infer_role_and_side(*decoded, trader);
        const auto breakdown = onchain::compute_fill_for_target(*decoded, trader);

        spdlog::debug("taker leg {}", utils::fields({{"maker", decoded->taker_order.maker},
                                                     {"side", to_string(copytrade::side_from_wire(decoded->taker_order.side))},
                                                     {"makerAmount", decoded->taker_order.maker_amount.str()},
                                                     {"takerAmount", decoded->taker_order.taker_amount.str()}}));
        for (std::size_t i = 0; i < decoded->maker_orders.size(); ++i) {
            const auto& leg = decoded->maker_orders[i];
            spdlog::debug("maker leg {}", utils::fields({{"index", i},
                                                         {"maker", leg.maker},
                                                         {"side", to_string(copytrade::side_from_wire(leg.side))},
                                                         {"makerAmount", leg.maker_amount.str()},
                                                         {"takerAmount", leg.taker_amount.str()},
                                                         {"fill", decoded->maker_fill_amounts[i].str()}}));
        }

        std::optional<exchange::Market> market;
        if (info.token_id) {
            auto gamma = std::make_shared<const exchange::GammaRest>(
                config.gamma_api_url, config.gamma_api_key, config.http_timeout_ms, config.http_retries);
            exchange::MarketResolver markets(exchange::MarketResolver::from_gamma(gamma));
            market = markets.resolve_by_token_id(*info.token_id);

            auto clob = std::make_shared<const exchange::ClobRest>(config.clob_rest_url, config.http_timeout_ms);
            exchange::TokenResolver tokens(exchange::TokenResolver::from_clob(clob));
            if (auto token = tokens.resolve(*info.token_id)) {
                spdlog::debug("token {}", utils::fields({{"tokenId", token->token_id},
                                                         {"marketId", token->market_id},
                                                         {"assetId", token->asset_id}}));
            }
        }

        copytrade::ReadableReport r;
        r.role   = to_string(breakdown.role != copytrade::Role::Unknown ? breakdown.role : info.role);
        r.side   = to_string(breakdown.side != copytrade::Side::Unknown ? breakdown.side : info.side);
        r.shares = breakdown.shares ? breakdown.shares : std::optional<std::string>(decoded->taker_receive_amount.str());
        r.usdc   = breakdown.usdc ? breakdown.usdc : std::optional<std::string>(decoded->taker_fill_amount.str());
        r.hash   = hash;
        if (market) {
            r.market_title = market->question;
            r.market_slug  = market->slug;
            r.closed       = market->closed;
        }

        for (const auto& line : copytrade::StrategyRouter::format_readable_lines(r)) {
            std::cout << line << "\n";
        }
    } catch (const std::exception& ex) {
        spdlog::error("decode_tx failed {}", utils::fields({{"hash", hash}, {"err", ex.what()}}));
        return 1;
    }

    return 0;
}
