// include/exchange/gamma_rest.hpp
#pragma once

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <vector>

namespace exchange {

struct Market {
    std::string id;
    std::string slug;
    std::string question;
    std::string condition_id;
    std::optional<bool> closed;
    std::optional<bool> active;

    std::vector<std::string> outcomes;
    std::vector<double>      outcome_prices;
    std::vector<std::string> clob_token_ids;
};

// Market metadata REST API (read-only, no auth required; an API key is sent
// when configured). Non-2xx responses >= 500, 429 and 408 and transport
// failures are retried up to `retries` extra times.
class GammaRest {
public:
    explicit GammaRest(std::string base_url = "https://gamma-api.polymarket.com",
                       std::string api_key  = "",
                       long        timeout_ms = 8000,
                       int         retries    = 1);

    // /markets?clob_token_ids=<id>&limit=1 ; nullopt when the list is empty.
    std::optional<Market> get_market_by_token_id(const std::string& token_id) const;

    Market get_market_by_id(const std::string& id) const;
    Market get_market_by_slug(const std::string& slug) const;

    // Gamma returns list-valued fields either as arrays, JSON-encoded strings
    // or comma-separated strings; all three are accepted.
    static Market parse_market(const nlohmann::json& j);

    static bool should_retry(long status) noexcept;

private:
    nlohmann::json fetch_json(const std::string& path, const std::string& query = "") const;

    std::string base_url_;
    std::string api_key_;
    long        timeout_ms_;
    int         retries_;
};

} // namespace exchange
