#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/price_relay.hpp"
#include "../src/relay_codec.hpp"
#include "fakes.hpp"

using std::chrono::milliseconds;

namespace {

ObservedTrade curve_trade() {
    ObservedTrade t;
    t.signature = "sig-1";
    t.token_address = "MintA";
    t.transaction_type = TransactionType::Buy;
    t.dex_type = DexType::PumpFun;
    t.timestamp = 1700000000;
    t.bonding_curve_key = "CurveA";
    t.reported_reserves = {1000000000000000LL, 30000000000LL};
    return t;
}

} // namespace

TEST_CASE("Price relay", "[price_relay]") {
    EventBus bus;
    auto chain = std::make_shared<FakeChain>();
    auto transport = std::make_shared<FakeTransport>();
    auto publisher = std::make_shared<RelayPublisher>(transport, nullptr, [](milliseconds) {});
    SolPriceTracker sol_price;
    PriceRelay relay(bus, chain, publisher, sol_price);

    chain->accounts["CurveA"] = bonding_curve_account(1000000000000000ULL, 30000000000ULL);
    chain->accounts["MintA"] = mint_account(1000000000000000ULL, 6);

    SECTION("Curve trade is priced from chain") {
        sol_price.update(150.0);
        auto update = relay.price_from_trade(curve_trade());

        REQUIRE(update.has_value());
        REQUIRE(update->price_sol == Catch::Approx(30.0 / 1e9));
        REQUIRE(*update->liquidity == Catch::Approx(30.0));
        REQUIRE(*update->price_usd == Catch::Approx(30.0 / 1e9 * 150.0));
        REQUIRE(*update->liquidity_usd == Catch::Approx(4500.0));
        REQUIRE(update->market_cap == Catch::Approx(1e9 * (30.0 / 1e9) * 150.0));
        REQUIRE(update->pool_address == std::optional<std::string>("CurveA"));
        REQUIRE(update->dex_type == DexType::PumpFun);
    }

    SECTION("Unknown SOL price leaves USD fields unset") {
        auto update = relay.price_from_trade(curve_trade());
        REQUIRE_FALSE(update->price_usd.has_value());
        REQUIRE(update->market_cap == 0.0);
    }

    SECTION("Non-curve trades are not priced") {
        auto t = curve_trade();
        t.dex_type = DexType::Raydium;
        REQUIRE_FALSE(relay.price_from_trade(t).has_value());
    }

    SECTION("Tracked wallet trades are published") {
        relay.handle_event(make_tracked_wallet_trade(curve_trade()));
        REQUIRE(relay.published() == 1);
        REQUIRE(transport->published.size() == 1);
        REQUIRE(transport->published[0].first == relay::PRICE_UPDATES_CHANNEL);
    }

    SECTION("Other events are ignored") {
        relay.handle_event(make_copy_trade_executed(curve_trade()));
        REQUIRE(transport->published.empty());
    }

    SECTION("Missing curve account is logged, not thrown") {
        chain->accounts.erase("CurveA");
        REQUIRE_NOTHROW(relay.handle_event(make_tracked_wallet_trade(curve_trade())));
        REQUIRE(relay.published() == 0);
    }

    SECTION("Background loop picks events off the bus") {
        relay.start();
        bus.emit(make_tracked_wallet_trade(curve_trade()));
        for (int i = 0; i < 100 && relay.published() == 0; i++) {
            std::this_thread::sleep_for(milliseconds(20));
        }
        relay.stop();
        REQUIRE(relay.published() == 1);
    }
}
