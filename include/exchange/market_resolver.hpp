// include/exchange/market_resolver.hpp
#pragma once

#include "exchange/gamma_rest.hpp"
#include "utils/ttl_cache.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace exchange {

// What the strategy needs from metadata: token id -> market, or nullopt when
// unknown or unreachable. Implementations never throw.
class MarketSource {
public:
    virtual ~MarketSource() = default;
    virtual std::optional<Market> resolve_by_token_id(const std::string& token_id) = 0;
};

/**
 * Cached front for the Gamma metadata API.
 *
 * Keys are "id:<id>", "slug:<slug>" and "token:<clob token id>". A found
 * market is stored under every alias it carries with the positive TTL; a miss
 * or a failed fetch is stored under the requested key only, with the
 * (shorter) negative TTL, so an unknown token is not refetched per event.
 */
class MarketResolver : public MarketSource {
public:
    using Fetch = std::function<std::optional<Market>(const std::string&)>;

    struct Fetchers {
        Fetch by_id;
        Fetch by_slug;
        Fetch by_token_id;
    };

    static Fetchers from_gamma(std::shared_ptr<const GammaRest> gamma);

    explicit MarketResolver(Fetchers                  fetchers,
                            std::chrono::milliseconds ttl          = std::chrono::seconds(60),
                            std::chrono::milliseconds negative_ttl = std::chrono::seconds(10),
                            utils::TtlCache<std::string, std::optional<Market>>::NowFn now =
                                &std::chrono::steady_clock::now);

    std::optional<Market> resolve_by_id(const std::string& id);
    std::optional<Market> resolve_by_slug(const std::string& slug);
    std::optional<Market> resolve_by_token_id(const std::string& token_id) override;

    // Outer nullopt: not cached. Inner nullopt: cached negative result.
    std::optional<std::optional<Market>> cached(const std::string& key);

    void clear();

private:
    std::optional<Market> resolve(const std::string& key, const Fetch& fetch, const std::string& arg);
    void put_aliases(const Market& market);

    Fetchers                  fetchers_;
    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds negative_ttl_;

    utils::TtlCache<std::string, std::optional<Market>> cache_;
};

} // namespace exchange
