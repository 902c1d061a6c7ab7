#include <catch2/catch_test_macros.hpp>
#include "../src/copy_policy.hpp"

namespace {

ObservedTrade trade(TransactionType type, const std::string& token = "MintA", double amount_token = 500.0) {
    ObservedTrade t;
    t.signature = "sig";
    t.token_address = token;
    t.transaction_type = type;
    t.amount_token = amount_token;
    t.amount_sol = 0.5;
    return t;
}

CopyTradeSettings settings() {
    CopyTradeSettings s;
    s.tracked_wallet_id = "w1";
    s.is_enabled = true;
    s.trade_amount_sol = 0.1;
    s.max_slippage = 1.0;
    s.max_open_positions = 2;
    s.min_sol_balance = 0.05;
    return s;
}

TokenHolding holding(const std::string& token, const std::string& balance) {
    TokenHolding h;
    h.address = token;
    h.balance = balance;
    return h;
}

WalletInfo wallet(double balance, std::vector<TokenHolding> tokens = {}) {
    WalletInfo w;
    w.balance = balance;
    w.tokens = std::move(tokens);
    return w;
}

} // namespace

TEST_CASE("Copy policy gates", "[policy]") {
    RuleBasedCopyPolicy policy;
    auto s = settings();

    SECTION("Transfers are never copied") {
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Transfer), s, wallet(10.0)).should_copy);
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Unknown), s, wallet(10.0)).should_copy);
    }

    SECTION("Slippage outside range") {
        s.max_slippage = 101.0;
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Buy), s, wallet(10.0)).should_copy);
    }

    SECTION("Allow-list") {
        s.use_allowed_tokens_list = true;
        s.allowed_tokens = std::vector<std::string>{"MintB"};
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Buy, "MintA"), s, wallet(10.0)).should_copy);
        REQUIRE(policy.evaluate(trade(TransactionType::Buy, "MintB"), s, wallet(10.0)).should_copy);
    }

    SECTION("Allow-list enabled without tokens rejects everything") {
        s.use_allowed_tokens_list = true;
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Buy), s, wallet(10.0)).should_copy);
    }
}

TEST_CASE("Copy policy buys", "[policy]") {
    RuleBasedCopyPolicy policy;
    auto s = settings();

    SECTION("Buy spends the configured amount") {
        auto decision = policy.evaluate(trade(TransactionType::Buy), s, wallet(1.0));
        REQUIRE(decision.should_copy);
        REQUIRE(decision.quantity == 0.1);
    }

    SECTION("Balance floor") {
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Buy), s, wallet(0.14)).should_copy);
    }

    SECTION("Held token needs additional buys enabled") {
        auto w = wallet(1.0, {holding("MintA", "10")});
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Buy), s, w).should_copy);
        s.allow_additional_buys = true;
        REQUIRE(policy.evaluate(trade(TransactionType::Buy), s, w).should_copy);
    }

    SECTION("Open position cap") {
        auto w = wallet(1.0, {holding("MintX", "1"), holding("MintY", "2"), holding("MintZ", "0")});
        REQUIRE(w.open_positions() == 2);
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Buy), s, w).should_copy);

        s.max_open_positions = 3;
        REQUIRE(policy.evaluate(trade(TransactionType::Buy), s, w).should_copy);
    }

    SECTION("Zero position cap blocks new positions") {
        s.max_open_positions = 0;
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Buy), s, wallet(1.0)).should_copy);
    }
}

TEST_CASE("Copy policy sells", "[policy]") {
    RuleBasedCopyPolicy policy;
    auto s = settings();

    SECTION("Nothing held") {
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Sell), s, wallet(1.0)).should_copy);
        auto w = wallet(1.0, {holding("MintA", "0")});
        REQUIRE_FALSE(policy.evaluate(trade(TransactionType::Sell), s, w).should_copy);
    }

    SECTION("Sells the whole position by default") {
        auto w = wallet(1.0, {holding("MintA", "1200")});
        auto decision = policy.evaluate(trade(TransactionType::Sell, "MintA", 500.0), s, w);
        REQUIRE(decision.should_copy);
        REQUIRE(decision.quantity == 1200.0);
    }

    SECTION("Matched sells are capped by the position") {
        s.match_sell_percentage = true;
        auto w = wallet(1.0, {holding("MintA", "1200")});
        REQUIRE(policy.evaluate(trade(TransactionType::Sell, "MintA", 500.0), s, w).quantity == 500.0);
        REQUIRE(policy.evaluate(trade(TransactionType::Sell, "MintA", 5000.0), s, w).quantity == 1200.0);
    }

    SECTION("Sells ignore the balance floor") {
        auto w = wallet(0.0, {holding("MintA", "10")});
        REQUIRE(policy.evaluate(trade(TransactionType::Sell), s, w).should_copy);
    }
}
