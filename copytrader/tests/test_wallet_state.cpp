#include <catch2/catch_test_macros.hpp>
#include "../src/wallet_state.hpp"

namespace {

WalletStateChange change(const std::string& address, WalletStateChangeType type,
                         nlohmann::json details = nlohmann::json::object()) {
    WalletStateChange c;
    c.wallet_address = address;
    c.change_type = type;
    c.timestamp = "2024-01-01T00:00:00Z";
    c.details = std::move(details);
    return c;
}

CopyTradeSettings settings_for(const std::string& wallet_id, double amount) {
    CopyTradeSettings s;
    s.tracked_wallet_id = wallet_id;
    s.trade_amount_sol = amount;
    return s;
}

} // namespace

TEST_CASE("Tracked wallet store", "[wallet_state]") {
    TrackedWalletStore store;

    SECTION("Add, archive, unarchive, delete") {
        store.apply(change("WalletA", WalletStateChangeType::Added, {{"id", "id-a"}}));
        REQUIRE(store.active_addresses() == std::vector<std::string>{"WalletA"});
        REQUIRE(store.snapshot()[0].id == std::optional<std::string>("id-a"));

        store.apply(change("WalletA", WalletStateChangeType::Archived));
        REQUIRE(store.active_addresses().empty());
        REQUIRE(store.snapshot().size() == 1);

        store.apply(change("WalletA", WalletStateChangeType::Unarchived));
        REQUIRE(store.active_addresses() == std::vector<std::string>{"WalletA"});

        store.apply(change("WalletA", WalletStateChangeType::Deleted));
        REQUIRE(store.snapshot().empty());
    }

    SECTION("Adding twice keeps one entry") {
        store.apply(change("WalletA", WalletStateChangeType::Added));
        store.apply(change("WalletA", WalletStateChangeType::Added));
        REQUIRE(store.snapshot().size() == 1);
    }

    SECTION("Update applies details") {
        store.apply(change("WalletA", WalletStateChangeType::Added));
        store.apply(change("WalletA", WalletStateChangeType::Updated, {{"is_active", false}, {"id", "id-9"}}));

        auto wallets = store.snapshot();
        REQUIRE_FALSE(wallets[0].is_active);
        REQUIRE(wallets[0].id == std::optional<std::string>("id-9"));
    }

    SECTION("Revision follows the active set") {
        auto before = store.revision();
        store.replace({});
        REQUIRE(store.revision() == before + 1);

        store.apply(change("WalletA", WalletStateChangeType::Added));
        REQUIRE(store.revision() == before + 2);

        store.apply(change("WalletA", WalletStateChangeType::Archived));
        store.apply(change("WalletA", WalletStateChangeType::Unarchived));
        REQUIRE(store.revision() == before + 4);

        store.apply(change("WalletA", WalletStateChangeType::Updated, {{"is_active", false}}));
        REQUIRE(store.revision() == before + 5);
    }

    SECTION("Duplicate or unknown events leave the revision alone") {
        store.apply(change("WalletA", WalletStateChangeType::Added));
        auto rev = store.revision();

        store.apply(change("WalletA", WalletStateChangeType::Added));
        store.apply(change("WalletA", WalletStateChangeType::Unarchived));
        store.apply(change("WalletA", WalletStateChangeType::Updated, {{"is_active", true}, {"id", "id-2"}}));
        store.apply(change("Unknown", WalletStateChangeType::Archived));
        store.apply(change("Unknown", WalletStateChangeType::Deleted));

        REQUIRE(store.revision() == rev);
        REQUIRE(store.active_addresses() == std::vector<std::string>{"WalletA"});
        REQUIRE(store.snapshot()[0].id == std::optional<std::string>("id-2"));
    }

    SECTION("Replace loads a repository snapshot") {
        TrackedWallet a;
        a.wallet_address = "WalletA";
        TrackedWallet b;
        b.wallet_address = "WalletB";
        b.is_active = false;
        store.replace({a, b});
        REQUIRE(store.active_addresses() == std::vector<std::string>{"WalletA"});
    }
}

TEST_CASE("Copy settings store", "[wallet_state]") {
    CopySettingsStore store;
    store.replace({settings_for("w1", 0.1), settings_for("w2", 0.2)});

    SECTION("Upsert replaces in place") {
        store.upsert(settings_for("w2", 0.5));
        auto all = store.snapshot();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].tracked_wallet_id == "w1");
        REQUIRE(all[1].trade_amount_sol == 0.5);
    }

    SECTION("Upsert appends unknown wallets") {
        store.upsert(settings_for("w3", 0.3));
        REQUIRE(store.size() == 3);
        REQUIRE(store.snapshot().back().tracked_wallet_id == "w3");
    }
}

TEST_CASE("SOL price tracker", "[wallet_state]") {
    SolPriceTracker tracker;
    REQUIRE(tracker.get() == 0.0);
    tracker.update(151.5);
    REQUIRE(tracker.get() == 151.5);
}
