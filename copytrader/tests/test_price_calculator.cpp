#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/price_calculator.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"

TEST_CASE("Price from vault balances", "[price]") {
    SECTION("Zero base balance yields zero") {
        REQUIRE(PriceCalculator::calculate_price_from_raw_balances(0, 5000000000ULL, 6, 9) == 0.0);
    }

    SECTION("Decimals are applied to both sides") {
        // 2,000 tokens against 10 SOL
        double price = PriceCalculator::calculate_price_from_raw_balances(2000000000ULL, 10000000000ULL, 6, 9);
        REQUIRE(price == Catch::Approx(0.005));
    }

    SECTION("Liquidity doubles the quote side") {
        REQUIRE(PriceCalculator::calculate_liquidity_sol(10000000000ULL, 9) == Catch::Approx(20.0));
    }

    SECTION("Price impact is zero for an empty pool") {
        REQUIRE(PriceCalculator::calculate_price_impact(0, 0, 1.0, 6, 9) == 0.0);
    }

    SECTION("Price impact grows with trade size") {
        double small = PriceCalculator::calculate_price_impact(2000000000ULL, 10000000000ULL, 0.1, 6, 9);
        double large = PriceCalculator::calculate_price_impact(2000000000ULL, 10000000000ULL, 5.0, 6, 9);
        REQUIRE(small > 0.0);
        REQUIRE(large > small);
    }
}

TEST_CASE("Price validation", "[price]") {
    SECTION("Negative price") {
        REQUIRE_THROWS_AS(PriceCalculator::validate_price_data(-1.0, 1, 1), InvalidPriceError);
    }

    SECTION("Absurd price") {
        REQUIRE_THROWS_AS(PriceCalculator::validate_price_data(1000.5, 1, 1), InvalidPriceError);
    }

    SECTION("Zero balance") {
        REQUIRE_THROWS_AS(PriceCalculator::validate_price_data(0.5, 0, 1), InvalidPriceError);
        REQUIRE_THROWS_AS(PriceCalculator::validate_price_data(0.5, 1, 0), InvalidPriceError);
    }

    SECTION("Sane data passes") {
        REQUIRE_NOTHROW(PriceCalculator::validate_price_data(0.5, 100, 100));
    }
}

TEST_CASE("Volume weighted price", "[price]") {
    SECTION("No updates") {
        REQUIRE_FALSE(PriceCalculator::calculate_vwap({}).has_value());
    }

    SECTION("Weighted by liquidity") {
        std::vector<VaultPriceUpdate> updates = {
            {"mint", 1.0, 10.0, 0},
            {"mint", 2.0, 10.0, 0},
        };
        auto vwap = PriceCalculator::calculate_vwap(updates);
        REQUIRE(vwap.has_value());
        REQUIRE(*vwap == Catch::Approx(1.5));
    }

    SECTION("No liquidity") {
        std::vector<VaultPriceUpdate> updates = {{"mint", 1.0, 0.0, 0}};
        REQUIRE_FALSE(PriceCalculator::calculate_vwap(updates).has_value());
    }
}

TEST_CASE("Market cap", "[price]") {
    FakeChain chain;

    SECTION("Unknown mint yields zero") {
        REQUIRE(PriceCalculator::calculate_market_cap(0.001, 150.0, "mint", chain) == 0.0);
    }

    SECTION("Supply times price times SOL price") {
        chain.accounts["mint"] = mint_account(1000000000000000ULL, 6);
        double mcap = PriceCalculator::calculate_market_cap(0.00001, 150.0, "mint", chain);
        REQUIRE(mcap == Catch::Approx(1e9 * 0.00001 * 150.0));
    }

    SECTION("Raydium price update") {
        chain.accounts["mint"] = mint_account(1000000000000000ULL, 6);
        VaultPriceUpdate vault{"mint", 0.00001, 40.0, 1700000000};
        auto update = PriceCalculator::convert_to_price_update(vault, "pool", 150.0, chain);

        REQUIRE(update.dex_type == DexType::Raydium);
        REQUIRE(update.pool_address == std::optional<std::string>("pool"));
        REQUIRE(*update.price_usd == Catch::Approx(0.0015));
        REQUIRE(*update.liquidity_usd == Catch::Approx(6000.0));
        REQUIRE_FALSE(update.volume_24h.has_value());
    }
}

TEST_CASE("Price helpers", "[price]") {
    REQUIRE(PriceCalculator::calculate_price_change(0.0, 5.0) == 0.0);
    REQUIRE(PriceCalculator::calculate_price_change(2.0, 3.0) == Catch::Approx(50.0));
    REQUIRE(PriceCalculator::get_optimal_trade_size(100000000000ULL, 1.0, 9) == Catch::Approx(0.5));
}
