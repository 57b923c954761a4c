// src/exchange/market_resolver.cpp
#include "exchange/market_resolver.hpp"
#include "utils/log.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace exchange {

MarketResolver::Fetchers MarketResolver::from_gamma(std::shared_ptr<const GammaRest> gamma)
{
    Fetchers f;
    f.by_id = [gamma](const std::string& id) -> std::optional<Market> {
        return gamma->get_market_by_id(id);
    };
    f.by_slug = [gamma](const std::string& slug) -> std::optional<Market> {
        return gamma->get_market_by_slug(slug);
    };
    f.by_token_id = [gamma](const std::string& token_id) {
        return gamma->get_market_by_token_id(token_id);
    };
    return f;
}

MarketResolver::MarketResolver(Fetchers                  fetchers,
                               std::chrono::milliseconds ttl,
                               std::chrono::milliseconds negative_ttl,
                               utils::TtlCache<std::string, std::optional<Market>>::NowFn now)
    : fetchers_(std::move(fetchers))
    , ttl_(ttl)
    , negative_ttl_(negative_ttl)
    , cache_(std::move(now))
{
}

std::optional<Market> MarketResolver::resolve_by_id(const std::string& id)
{
    return resolve("id:" + id, fetchers_.by_id, id);
}

std::optional<Market> MarketResolver::resolve_by_slug(const std::string& slug)
{
    return resolve("slug:" + slug, fetchers_.by_slug, slug);
}

std::optional<Market> MarketResolver::resolve_by_token_id(const std::string& token_id)
{
    auto market = resolve("token:" + token_id, fetchers_.by_token_id, token_id);
    if (market && std::find(market->clob_token_ids.begin(), market->clob_token_ids.end(), token_id) ==
                      market->clob_token_ids.end()) {
        market->clob_token_ids.push_back(token_id);
    }
    return market;
}

std::optional<std::optional<Market>> MarketResolver::cached(const std::string& key)
{
    return cache_.get(key);
}

void MarketResolver::clear()
{
    cache_.clear();
}

std::optional<Market> MarketResolver::resolve(const std::string& key, const Fetch& fetch, const std::string& arg)
{
    if (auto hit = cache_.get(key)) {
        spdlog::debug("gamma cache hit {}", utils::fields({{"key", key}}));
        return *hit;
    }

    auto ttl_for = [this](const std::optional<Market>& m) -> utils::TtlCache<std::string, std::optional<Market>>::Duration {
        return m ? ttl_ : negative_ttl_;
    };

    auto market = cache_.get_or_load(key, ttl_for, [&]() -> std::optional<Market> {
        if (!fetch) {
            return std::nullopt;
        }
        try {
            return fetch(arg);
        } catch (const std::exception& ex) {
            spdlog::debug("gamma resolve error {}", utils::fields({{"key", key}, {"err", ex.what()}}));
            return std::nullopt;
        }
    });

    if (market) {
        put_aliases(*market);
    }
    return market;
}

void MarketResolver::put_aliases(const Market& market)
{
    if (!market.id.empty()) {
        cache_.set("id:" + market.id, market, ttl_);
    }
    if (!market.slug.empty()) {
        cache_.set("slug:" + market.slug, market, ttl_);
    }
    for (const auto& token_id : market.clob_token_ids) {
        cache_.set("token:" + token_id, market, ttl_);
    }
}

} // namespace exchange
