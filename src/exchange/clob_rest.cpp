// src/exchange/clob_rest.cpp
#include "exchange/clob_rest.hpp"
#include "utils/http_client.hpp"
#include "utils/log.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

using nlohmann::json;

namespace {

// Accepts standard or url-safe alphabet, with or without padding.
std::string base64_decode(std::string in)
{
    std::replace(in.begin(), in.end(), '-', '+');
    std::replace(in.begin(), in.end(), '_', '/');
    while (in.size() % 4 != 0) {
        in.push_back('=');
    }

    std::string out(in.size() / 4 * 3, '\0');
    const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(in.data()),
                                  static_cast<int>(in.size()));
    if (n < 0) {
        throw std::invalid_argument("CLOB API secret is not valid base64");
    }

    // EVP_DecodeBlock counts padding bytes as output
    std::size_t len = static_cast<std::size_t>(n);
    for (auto it = in.rbegin(); it != in.rend() && *it == '=' && len > 0; ++it) {
        --len;
    }
    out.resize(len);
    return out;
}

std::string base64_url_encode(const unsigned char* data, std::size_t size)
{
    std::string out(4 * ((size + 2) / 3), '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(size));
    out.resize(static_cast<std::size_t>(n));
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::string unix_seconds()
{
    using namespace std::chrono;
    return std::to_string(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace

namespace exchange {

ClobRest::ClobRest(std::string base_url, long timeout_ms)
    : base_url_(std::move(base_url))
    , timeout_ms_(timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::optional<TokenInfo> ClobRest::get_book_info(const std::string& token_id) const
{
    utils::HttpClient client(base_url_, timeout_ms_);

    std::string body;
    try {
        body = client.get("/book", "token_id=" + utils::HttpClient::url_encode(token_id));
    } catch (const utils::HttpError& ex) {
        spdlog::debug("token resolver book non-200 {}",
                      utils::fields({{"tokenId", token_id}, {"status", ex.status()}}));
        return std::nullopt;
    }

    const json j = json::parse(body);
    TokenInfo info;
    info.token_id  = token_id;
    info.market_id = j.value("market", std::string());
    info.asset_id  = j.value("asset_id", std::string());
    return info;
}

std::string ClobRest::sign_l2(const std::string& secret_b64, const std::string& message)
{
    const std::string key = base64_decode(secret_b64);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  digest_len = 0;

    const unsigned char* ok = HMAC(EVP_sha256(),
                                   key.data(), static_cast<int>(key.size()),
                                   reinterpret_cast<const unsigned char*>(message.data()),
                                   message.size(),
                                   digest, &digest_len);
    if (ok == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return base64_url_encode(digest, digest_len);
}

ClobRest::Headers ClobRest::l2_headers(const ClobCredentials& creds,
                                       const std::string&     timestamp,
                                       const std::string&     method,
                                       const std::string&     path,
                                       const std::string&     body)
{
    return {
        {"POLY_ADDRESS", creds.funding_address},
        {"POLY_SIGNATURE", sign_l2(creds.api_secret, timestamp + method + path + body)},
        {"POLY_TIMESTAMP", timestamp},
        {"POLY_API_KEY", creds.api_key},
        {"POLY_PASSPHRASE", creds.api_passphrase},
    };
}

json ClobRest::post_order(const json& body, const ClobCredentials& creds) const
{
    const std::string path    = "/order";
    const std::string payload = body.dump();

    utils::HttpClient client(base_url_, timeout_ms_);
    const auto headers = l2_headers(creds, unix_seconds(), "POST", path, payload);
    return json::parse(client.post(path, payload, headers));
}

ClobRestVenue::ClobRestVenue(std::shared_ptr<const ClobRest> rest,
                             std::shared_ptr<OrderSigner>    signer,
                             ClobCredentials                 creds)
    : rest_(std::move(rest))
    , signer_(std::move(signer))
    , creds_(std::move(creds))
{
    if (!rest_) {
        throw std::invalid_argument("ClobRestVenue: null REST client");
    }
    if (!signer_) {
        throw std::invalid_argument("ClobRestVenue: null order signer");
    }
}

json ClobRestVenue::order_body(json                   signed_order,
                               copytrade::OrderType   type,
                               const ClobCredentials& creds)
{
    const bool has_signature = signed_order.is_object() && signed_order.contains("signature") &&
                               signed_order.at("signature").is_string() &&
                               !signed_order.at("signature").get<std::string>().empty();
    if (!has_signature) {
        throw std::runtime_error("order signer returned an unsigned order");
    }

    json body;
    body["order"]     = std::move(signed_order);
    body["owner"]     = creds.api_key;
    body["orderType"] = copytrade::to_string(type);
    return body;
}

std::string ClobRestVenue::submit(const VenueOrder& order, copytrade::OrderType type)
{
    const json res = rest_->post_order(order_body(signer_->sign(order), type, creds_), creds_);

    if (res.is_object() && !res.value("success", true)) {
        const std::string msg = res.value("errorMsg", std::string("order rejected"));
        throw std::runtime_error("CLOB rejected order: " + msg);
    }
    if (res.is_object() && res.contains("orderID") && res.at("orderID").is_string()) {
        return res.at("orderID").get<std::string>();
    }
    return {};
}

TokenResolver::TokenResolver(Fetch fetch, std::chrono::milliseconds ttl, std::chrono::milliseconds negative_ttl)
    : fetch_(std::move(fetch))
    , ttl_(ttl)
    , negative_ttl_(negative_ttl)
{
}

TokenResolver::Fetch TokenResolver::from_clob(std::shared_ptr<const ClobRest> rest)
{
    return [rest](const std::string& token_id) { return rest->get_book_info(token_id); };
}

std::optional<TokenInfo> TokenResolver::resolve(const std::string& token_id)
{
    if (token_id.empty()) {
        return std::nullopt;
    }

    auto ttl_for = [this](const std::optional<TokenInfo>& info)
        -> utils::TtlCache<std::string, std::optional<TokenInfo>>::Duration {
        return info ? ttl_ : negative_ttl_;
    };

    return cache_.get_or_load(token_id, ttl_for, [&]() -> std::optional<TokenInfo> {
        if (!fetch_) {
            return std::nullopt;
        }
        try {
            return fetch_(token_id);
        } catch (const std::exception& ex) {
            spdlog::debug("token resolver fetch error {}",
                          utils::fields({{"tokenId", token_id}, {"err", ex.what()}}));
            return std::nullopt;
        }
    });
}

} // namespace exchange
