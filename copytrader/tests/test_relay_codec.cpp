#include <catch2/catch_test_macros.hpp>
#include "../src/relay_codec.hpp"
#include "../src/errors.hpp"

using json = nlohmann::json;

namespace {

json valid_settings() {
    return json{
        {"id", "b3f1c7a0-0000-0000-0000-000000000001"},
        {"user_id", "server"},
        {"tracked_wallet_id", "wallet-1"},
        {"is_enabled", true},
        {"trade_amount_sol", 0.5},
        {"max_slippage", 2.0},
        {"max_open_positions", 3},
        {"allowed_tokens", nullptr},
        {"use_allowed_tokens_list", false},
        {"allow_additional_buys", false},
        {"match_sell_percentage", true},
        {"min_sol_balance", 0.05}
    };
}

} // namespace

TEST_CASE("Settings channel", "[relay]") {
    SECTION("Settings payload becomes a settings event") {
        auto event = relay::decode_message(relay::SETTINGS_CHANNEL, valid_settings().dump());
        REQUIRE(event.has_value());

        const auto& n = std::get<SettingsUpdateNotification>(*event);
        REQUIRE(n.type_ == event_tags::SETTINGS_UPDATED);
        REQUIRE(n.data.tracked_wallet_id == "wallet-1");
        REQUIRE(n.data.trade_amount_sol == 0.5);
        REQUIRE(n.data.max_open_positions == 3);
        REQUIRE(n.data.match_sell_percentage);
    }

    SECTION("Missing max_open_positions defaults to zero") {
        auto payload = valid_settings();
        payload.erase("max_open_positions");
        auto event = relay::decode_message(relay::SETTINGS_CHANNEL, payload.dump());
        REQUIRE(std::get<SettingsUpdateNotification>(*event).data.max_open_positions == 0);
    }

    SECTION("Delete payload carries nothing to apply") {
        auto event = relay::decode_message(relay::SETTINGS_CHANNEL, relay::encode_settings_delete("abc"));
        REQUIRE_FALSE(event.has_value());
    }

    SECTION("Invalid settings are rejected") {
        auto payload = valid_settings();
        payload["max_slippage"] = 150.0;
        REQUIRE_THROWS_AS(relay::decode_message(relay::SETTINGS_CHANNEL, payload.dump()), DecodeError);

        payload = valid_settings();
        payload["trade_amount_sol"] = 0.0;
        REQUIRE_THROWS_AS(relay::decode_message(relay::SETTINGS_CHANNEL, payload.dump()), DecodeError);
    }

    SECTION("Malformed JSON is rejected") {
        REQUIRE_THROWS_AS(relay::decode_message(relay::SETTINGS_CHANNEL, "{not json"), DecodeError);
    }

    SECTION("Encoded settings decode to the same values") {
        CopyTradeSettings s;
        s.tracked_wallet_id = "wallet-9";
        s.is_enabled = true;
        s.trade_amount_sol = 1.25;
        s.max_slippage = 5.0;
        s.allowed_tokens = std::vector<std::string>{"mintA"};
        s.use_allowed_tokens_list = true;

        auto event = relay::decode_message(relay::SETTINGS_CHANNEL, relay::encode_settings(s));
        const auto& decoded = std::get<SettingsUpdateNotification>(*event).data;
        REQUIRE(decoded.tracked_wallet_id == "wallet-9");
        REQUIRE(decoded.allowed_tokens.has_value());
        REQUIRE(*decoded.allowed_tokens == std::vector<std::string>{"mintA"});
        REQUIRE(decoded.allows_token("mintA"));
        REQUIRE_FALSE(decoded.allows_token("mintB"));
    }
}

TEST_CASE("Tracked wallets channel", "[relay]") {
    SECTION("Known actions map to change types") {
        auto add = relay::decode_message(relay::TRACKED_WALLETS_CHANNEL,
            relay::encode_tracked_wallet_update("walletA", "add", true, std::string("id-1")));
        auto archive = relay::decode_message(relay::TRACKED_WALLETS_CHANNEL,
            relay::encode_wallet_address_update("walletA", "archive"));
        auto unarchive = relay::decode_message(relay::TRACKED_WALLETS_CHANNEL,
            relay::encode_wallet_address_update("walletA", "unarchive"));
        auto del = relay::decode_message(relay::TRACKED_WALLETS_CHANNEL,
            relay::encode_wallet_address_update("walletA", "delete"));

        const auto& added = std::get<WalletStateNotification>(*add).data;
        REQUIRE(added.change_type == WalletStateChangeType::Added);
        REQUIRE(added.wallet_address == "walletA");
        REQUIRE(added.details["id"] == "id-1");
        REQUIRE_FALSE(added.timestamp.empty());

        REQUIRE(std::get<WalletStateNotification>(*archive).data.change_type == WalletStateChangeType::Archived);
        REQUIRE(std::get<WalletStateNotification>(*unarchive).data.change_type == WalletStateChangeType::Unarchived);
        REQUIRE(std::get<WalletStateNotification>(*del).data.change_type == WalletStateChangeType::Deleted);
    }

    SECTION("Unknown or missing action is ignored") {
        REQUIRE_FALSE(relay::decode_message(relay::TRACKED_WALLETS_CHANNEL,
            relay::encode_wallet_address_update("walletA", "rename")).has_value());
        REQUIRE_FALSE(relay::decode_message(relay::TRACKED_WALLETS_CHANNEL,
            R"({"wallet_address":"walletA"})").has_value());
        REQUIRE_FALSE(relay::is_known_wallet_action("rename"));
    }

    SECTION("Missing wallet address is rejected") {
        REQUIRE_THROWS_AS(relay::decode_message(relay::TRACKED_WALLETS_CHANNEL, R"({"action":"add"})"),
                          DecodeError);
    }
}

TEST_CASE("Price channels", "[relay]") {
    SECTION("Price update") {
        PriceUpdate update;
        update.token_address = "mint";
        update.price_sol = 0.00003;
        update.market_cap = 4500.0;
        update.timestamp = 1700000000;
        update.dex_type = DexType::PumpFun;
        update.pool_address = std::string("curve");

        auto event = relay::decode_message(relay::PRICE_UPDATES_CHANNEL, relay::encode_price_update(update));
        const auto& decoded = std::get<PriceUpdateNotification>(*event).data;
        REQUIRE(decoded.token_address == "mint");
        REQUIRE(decoded.dex_type == DexType::PumpFun);
        REQUIRE(decoded.pool_address == std::optional<std::string>("curve"));
        REQUIRE_FALSE(decoded.price_usd.has_value());
        REQUIRE_FALSE(decoded.volume_5m.has_value());
    }

    SECTION("SOL price update") {
        SolPriceUpdate update;
        update.price_usd = 151.25;
        update.source = PriceSource::Raydium;
        update.timestamp = 1700000000;

        auto event = relay::decode_message(relay::SOL_PRICE_UPDATES_CHANNEL, relay::encode_sol_price_update(update));
        const auto& decoded = std::get<SolPriceUpdateNotification>(*event).data;
        REQUIRE(decoded.price_usd == 151.25);
        REQUIRE(decoded.source == PriceSource::Raydium);
    }

    SECTION("Unknown channel") {
        REQUIRE_FALSE(relay::decode_message("elsewhere", "{}").has_value());
    }
}
