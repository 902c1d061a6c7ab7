#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/feed_parser.hpp"
#include "../src/errors.hpp"

TEST_CASE("Feed trade frames", "[feed]") {
    const std::string buy = R"({
        "signature": "sig1",
        "mint": "MintAddr",
        "traderPublicKey": "Trader",
        "txType": "buy",
        "tokenAmount": 1000000,
        "solAmount": 0.5,
        "bondingCurveKey": "Curve",
        "vTokensInBondingCurve": 1000000000,
        "vSolInBondingCurve": 31.5,
        "marketCapSol": 31.5,
        "name": "Token",
        "symbol": "TOK",
        "uri": "https://example.invalid/tok.json",
        "pool": "pump",
        "timestamp": 1700000000
    })";

    SECTION("Buy on the bonding curve") {
        auto trade = parse_feed_message(buy, 150.0);
        REQUIRE(trade.has_value());
        REQUIRE(trade->signature == "sig1");
        REQUIRE(trade->token_address == "MintAddr");
        REQUIRE(trade->token_symbol == "TOK");
        REQUIRE(trade->transaction_type == TransactionType::Buy);
        REQUIRE(trade->dex_type == DexType::PumpFun);
        REQUIRE(trade->price_per_token == Catch::Approx(0.5 / 1000000.0));
        REQUIRE(trade->usd_market_cap == Catch::Approx(31.5 * 150.0));
        REQUIRE(trade->buyer == "Trader");
        REQUIRE(trade->seller == "Curve");
        REQUIRE(trade->timestamp == 1700000000);
        REQUIRE(trade->bonding_curve_key == "Curve");
        REQUIRE(trade->reported_reserves.virtual_token_reserves == 1000000000000000LL);
        REQUIRE(trade->reported_reserves.virtual_sol_reserves == 31500000000LL);
    }

    SECTION("Sell swaps the counterparties") {
        auto j = nlohmann::json::parse(buy);
        j["txType"] = "sell";
        auto trade = parse_feed_message(j.dump(), 0.0);
        REQUIRE(trade->transaction_type == TransactionType::Sell);
        REQUIRE(trade->seller == "Trader");
        REQUIRE(trade->buyer == "Curve");
        REQUIRE(trade->usd_market_cap == 0.0);
    }

    SECTION("Raydium trade has no curve") {
        auto j = nlohmann::json::parse(buy);
        j["pool"] = "raydium";
        j.erase("bondingCurveKey");
        auto trade = parse_feed_message(j.dump(), 150.0);
        REQUIRE(trade->dex_type == DexType::Raydium);
        REQUIRE(trade->bonding_curve_key.empty());
        REQUIRE(trade->seller == "raydium");
    }

    SECTION("Zero token amount gives zero price") {
        auto j = nlohmann::json::parse(buy);
        j["tokenAmount"] = 0;
        REQUIRE(parse_feed_message(j.dump(), 150.0)->price_per_token == 0.0);
    }

    SECTION("Unknown side") {
        auto j = nlohmann::json::parse(buy);
        j["txType"] = "create";
        REQUIRE(parse_feed_message(j.dump(), 150.0)->transaction_type == TransactionType::Unknown);
    }
}

TEST_CASE("Feed control frames", "[feed]") {
    SECTION("Acknowledgements carry no trade") {
        REQUIRE_FALSE(parse_feed_message(R"({"message":"Successfully subscribed to keys."})", 0.0).has_value());
        REQUIRE_FALSE(parse_feed_message(R"({"errors":"bad key"})", 0.0).has_value());
        REQUIRE_FALSE(parse_feed_message("[]", 0.0).has_value());
    }

    SECTION("Malformed frames are decode errors") {
        REQUIRE_THROWS_AS(parse_feed_message("not json", 0.0), DecodeError);
        REQUIRE_THROWS_AS(parse_feed_message(R"({"signature":"s"})", 0.0), DecodeError);
        REQUIRE_THROWS_AS(parse_feed_message(
            R"({"signature":"s","mint":"m","txType":"buy","tokenAmount":"x","solAmount":1})", 0.0),
            DecodeError);
    }
}
