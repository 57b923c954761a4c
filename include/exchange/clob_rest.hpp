// include/exchange/clob_rest.hpp
#pragma once

#include "exchange/order_venue.hpp"
#include "utils/ttl_cache.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace exchange {

struct ClobCredentials {
    std::string private_key;
    std::string api_key;
    std::string api_secret;     // base64 (url-safe or standard)
    std::string api_passphrase;
    std::string funding_address;
    int         signature_type = 0; // 0 EOA, 1 proxy, 2 safe

    // Signing material and all three API fields present.
    bool complete() const noexcept
    {
        return !private_key.empty() && !api_key.empty() &&
               !api_secret.empty() && !api_passphrase.empty();
    }
};

struct TokenInfo {
    std::string token_id;
    std::string market_id;
    std::string asset_id;
};

// Venue REST API: public book lookup and authenticated order submission.
class ClobRest {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    explicit ClobRest(std::string base_url = "https://clob.polymarket.com", long timeout_ms = 8000);

    // GET /book?token_id=<id> ; nullopt on a non-2xx answer.
    std::optional<TokenInfo> get_book_info(const std::string& token_id) const;

    // POST /order with L2 headers; returns the parsed response body.
    nlohmann::json post_order(const nlohmann::json& body, const ClobCredentials& creds) const;

    // POLY_* headers: HMAC-SHA256 over timestamp + method + path + body keyed
    // with the decoded secret, url-safe base64.
    static Headers l2_headers(const ClobCredentials& creds,
                              const std::string&     timestamp,
                              const std::string&     method,
                              const std::string&     path,
                              const std::string&     body);

    static std::string sign_l2(const std::string& secret_b64, const std::string& message);

private:
    std::string base_url_;
    long        timeout_ms_;
};

// Turns one rounded order into the venue's signed order object (salt,
// maker/taker amounts, nonce, expiration, signature). Holds its own key.
// Throws when the order cannot be signed.
class OrderSigner {
public:
    virtual ~OrderSigner() = default;
    virtual nlohmann::json sign(const VenueOrder& order) = 0;
};

// OrderVenue over ClobRest. Every order is signed before it is posted.
class ClobRestVenue : public OrderVenue {
public:
    // Throws std::invalid_argument for a null client or signer.
    ClobRestVenue(std::shared_ptr<const ClobRest> rest,
                  std::shared_ptr<OrderSigner>    signer,
                  ClobCredentials                 creds);

    std::string submit(const VenueOrder& order, copytrade::OrderType type) override;

    // {"order": signed_order, "owner": api key, "orderType": type}. Throws
    // std::runtime_error when `signed_order` carries no signature.
    static nlohmann::json order_body(nlohmann::json         signed_order,
                                     copytrade::OrderType   type,
                                     const ClobCredentials& creds);

private:
    std::shared_ptr<const ClobRest> rest_;
    std::shared_ptr<OrderSigner>    signer_;
    ClobCredentials                 creds_;
};

// Token id -> book identifiers, TTL-cached in front of a fetch function.
class TokenResolver {
public:
    using Fetch = std::function<std::optional<TokenInfo>(const std::string&)>;

    explicit TokenResolver(Fetch fetch,
                           std::chrono::milliseconds ttl          = std::chrono::seconds(60),
                           std::chrono::milliseconds negative_ttl = std::chrono::seconds(10));

    static Fetch from_clob(std::shared_ptr<const ClobRest> rest);

    // Never throws; fetch failures resolve (and are cached) as nullopt.
    std::optional<TokenInfo> resolve(const std::string& token_id);

private:
    Fetch                     fetch_;
    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds negative_ttl_;

    utils::TtlCache<std::string, std::optional<TokenInfo>> cache_;
};

} // namespace exchange
