#include <gtest/gtest.h>

#include "exchange/clob_rest.hpp"
#include "fake_venue.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using namespace exchange;
using copytrade::OrderType;
using copytrade::Side;

TEST(ClobRest, SignL2MatchesHmacSha256) {
    // RFC 4231 test case 2, url-safe base64
    EXPECT_EQ(ClobRest::sign_l2("SmVmZQ==", "what do ya want for nothing?"),
              "W9zBRr9gdU5qBCQmCJV1x1oAPwidJzmDnexYuWTsOEM=");
    // unpadded secret decodes to the same key
    EXPECT_EQ(ClobRest::sign_l2("SmVmZQ", "what do ya want for nothing?"),
              "W9zBRr9gdU5qBCQmCJV1x1oAPwidJzmDnexYuWTsOEM=");
}

TEST(ClobRest, SignL2IsUrlSafe) {
    const std::string sig = ClobRest::sign_l2("c2VjcmV0LXNlY3JldC1zZWNyZXQ=", "1700000000POST/order{}");
    EXPECT_EQ(sig, "dbcTFkadjWKJcc2Ws4T3siNPbzLhxajBi_c9MU3bFp8=");
    EXPECT_EQ(sig.size(), 44u);
    EXPECT_EQ(sig.find('+'), std::string::npos);
    EXPECT_EQ(sig.find('/'), std::string::npos);

    EXPECT_NE(ClobRest::sign_l2("c2VjcmV0LXNlY3JldC1zZWNyZXQ=", "1700000001POST/order{}"), sig);
}

TEST(ClobRest, SignL2RejectsBadSecret) {
    EXPECT_THROW(ClobRest::sign_l2("not base64!!", "x"), std::invalid_argument);
}

TEST(ClobRest, L2HeadersSignTimestampMethodPathBody) {
    const ClobCredentials creds = testutil::full_credentials();
    const auto headers = ClobRest::l2_headers(creds, "1700000000", "POST", "/order", "{}");

    ASSERT_EQ(headers.size(), 5u);
    EXPECT_EQ(headers[0].first, "POLY_ADDRESS");
    EXPECT_EQ(headers[0].second, creds.funding_address);
    EXPECT_EQ(headers[1].first, "POLY_SIGNATURE");
    EXPECT_EQ(headers[1].second, "dbcTFkadjWKJcc2Ws4T3siNPbzLhxajBi_c9MU3bFp8=");
    EXPECT_EQ(headers[2].first, "POLY_TIMESTAMP");
    EXPECT_EQ(headers[2].second, "1700000000");
    EXPECT_EQ(headers[3].first, "POLY_API_KEY");
    EXPECT_EQ(headers[3].second, "key");
    EXPECT_EQ(headers[4].first, "POLY_PASSPHRASE");
    EXPECT_EQ(headers[4].second, "pass");
}

namespace {

// Signs by echoing the order fields with a fixed signature.
class StubSigner : public OrderSigner {
public:
    explicit StubSigner(std::string signature) : signature_(std::move(signature)) {}

    nlohmann::json sign(const VenueOrder& order) override
    {
        ++calls;
        return {{"tokenId", order.token_id},
                {"side", copytrade::to_string(order.side)},
                {"makerAmount", order.market ? order.amount : order.size},
                {"salt", 7},
                {"signature", signature_}};
    }

    int calls = 0;

private:
    std::string signature_;
};

std::shared_ptr<const ClobRest> unreachable_rest()
{
    return std::make_shared<const ClobRest>("http://127.0.0.1:1", 100);
}

} // namespace

TEST(ClobRestVenue, OrderBodyWrapsSignedOrder) {
    VenueOrder order;
    order.token_id = "12345";
    order.side     = Side::Buy;
    order.price    = "0.525";
    order.amount   = "5.25";
    order.market   = true;

    StubSigner signer("0xsig");
    const auto body = ClobRestVenue::order_body(signer.sign(order), OrderType::FAK,
                                                testutil::full_credentials());
    EXPECT_EQ(body["owner"], "key");
    EXPECT_EQ(body["orderType"], "FAK");
    EXPECT_EQ(body["order"]["tokenId"], "12345");
    EXPECT_EQ(body["order"]["side"], "BUY");
    EXPECT_EQ(body["order"]["makerAmount"], "5.25");
    EXPECT_EQ(body["order"]["salt"], 7);
    EXPECT_EQ(body["order"]["signature"], "0xsig");
}

TEST(ClobRestVenue, OrderBodyRejectsUnsignedOrder) {
    const auto creds = testutil::full_credentials();
    EXPECT_THROW(ClobRestVenue::order_body(nlohmann::json{{"tokenId", "1"}}, OrderType::GTC, creds),
                 std::runtime_error);
    EXPECT_THROW(ClobRestVenue::order_body(nlohmann::json{{"signature", ""}}, OrderType::GTC, creds),
                 std::runtime_error);
    EXPECT_THROW(ClobRestVenue::order_body(nlohmann::json::array(), OrderType::GTC, creds),
                 std::runtime_error);
}

TEST(ClobRestVenue, UnsignedOrderIsNeverPosted) {
    auto signer = std::make_shared<StubSigner>("");
    ClobRestVenue venue(unreachable_rest(), signer, testutil::full_credentials());

    VenueOrder order;
    order.token_id = "12345";
    order.side     = Side::Sell;
    order.price    = "0.5";
    order.size     = "20";

    EXPECT_THROW(venue.submit(order, OrderType::GTC), std::runtime_error);
    EXPECT_EQ(signer->calls, 1);
}

TEST(ClobRestVenue, RejectsNullClient) {
    EXPECT_THROW(ClobRestVenue(nullptr, std::make_shared<StubSigner>("0xsig"),
                               testutil::full_credentials()),
                 std::invalid_argument);
}

TEST(ClobRestVenue, RejectsNullSigner) {
    EXPECT_THROW(ClobRestVenue(unreachable_rest(), nullptr, testutil::full_credentials()),
                 std::invalid_argument);
}

TEST(TokenResolver, CachesHitsAndMisses) {
    int calls = 0;
    TokenResolver resolver([&](const std::string& token_id) -> std::optional<TokenInfo> {
        ++calls;
        if (token_id == "missing") return std::nullopt;
        return TokenInfo{token_id, "0xmarket", "asset-" + token_id};
    });

    auto info = resolver.resolve("7");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->market_id, "0xmarket");
    EXPECT_EQ(info->asset_id, "asset-7");
    resolver.resolve("7");
    EXPECT_EQ(calls, 1);

    EXPECT_FALSE(resolver.resolve("missing").has_value());
    EXPECT_FALSE(resolver.resolve("missing").has_value());
    EXPECT_EQ(calls, 2);
}

TEST(TokenResolver, FetchErrorsResolveToNothing) {
    int calls = 0;
    TokenResolver resolver([&](const std::string&) -> std::optional<TokenInfo> {
        ++calls;
        throw std::runtime_error("timeout");
    });

    EXPECT_FALSE(resolver.resolve("7").has_value());
    EXPECT_FALSE(resolver.resolve("").has_value());
    EXPECT_EQ(calls, 1);
}
