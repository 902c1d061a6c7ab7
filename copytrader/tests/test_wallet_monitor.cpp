#include <catch2/catch_test_macros.hpp>
#include "../src/wallet_monitor.hpp"
#include "../src/health.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"

using std::chrono::milliseconds;

namespace {

TransactionLog log_entry(const std::string& signature) {
    ObservedTrade t;
    t.signature = signature;
    t.token_address = "MintA";
    t.transaction_type = TransactionType::Sell;
    return TransactionLog::from_trade(t, "ServerWallet");
}

} // namespace

TEST_CASE("Wallet monitor", "[monitor]") {
    EventBus bus;
    auto repo = std::make_shared<FakeRepository>();
    TrackedWalletStore wallets;
    CopySettingsStore settings;
    SolPriceTracker sol_price;
    BlockingQueue<ObservedTrade> queue;
    StopToken stop;

    auto wallet = std::make_shared<FakeWallet>();
    CopyTradeOrchestrator orchestrator(bus, wallet, std::make_shared<FakeExecutor>(),
                                       std::make_shared<RuleBasedCopyPolicy>(), "ServerWallet");
    MessagePipeline pipeline(queue, orchestrator, settings, stop);
    ScriptedConnection connection;
    FeedMonitor feed(connection, wallets, queue, stop,
                     [](const std::string&) { return std::optional<ObservedTrade>(); });

    WalletMonitor monitor(repo, bus, wallets, settings, sol_price, pipeline, feed, stop, "ServerWallet");

    SECTION("Initialization creates the user and loads state") {
        TrackedWallet w;
        w.wallet_address = "WalletA";
        repo->wallets = {w};
        CopyTradeSettings s;
        s.tracked_wallet_id = "w1";
        repo->settings = {s};

        monitor.initialize();

        REQUIRE(repo->users == std::vector<std::string>{"ServerWallet"});
        REQUIRE(wallets.active_addresses() == std::vector<std::string>{"WalletA"});
        REQUIRE(settings.size() == 1);
    }

    SECTION("Repository failure is an initialization error") {
        repo->fail = true;
        REQUIRE_THROWS_AS(monitor.initialize(), InitializationError);
    }

    SECTION("Bus events update local state") {
        CopyTradeSettings s;
        s.tracked_wallet_id = "w1";
        monitor.handle_event(make_settings_updated(s));
        REQUIRE(settings.size() == 1);

        WalletStateChange change;
        change.wallet_address = "WalletB";
        change.change_type = WalletStateChangeType::Added;
        monitor.handle_event(make_wallet_state_changed(change));
        REQUIRE(wallets.active_addresses() == std::vector<std::string>{"WalletB"});

        SolPriceUpdate price;
        price.price_usd = 149.0;
        monitor.handle_event(make_sol_price_updated(price));
        REQUIRE(sol_price.get() == 149.0);
    }

    SECTION("Transaction logs are persisted") {
        monitor.handle_event(make_transaction_logged(log_entry("sig-1")));
        REQUIRE(repo->logs.size() == 1);
        REQUIRE(repo->logs[0].user_id == "ServerWallet");
        REQUIRE(monitor.logs_persisted() == 1);
    }

    SECTION("Persist failures are logged and skipped") {
        repo->fail = true;
        REQUIRE_NOTHROW(monitor.handle_event(make_transaction_logged(log_entry("sig-1"))));
        REQUIRE(monitor.logs_persisted() == 0);
    }

    SECTION("Start and stop") {
        monitor.start();
        REQUIRE(monitor.tasks_alive());
        monitor.stop();
        REQUIRE(stop.stop_requested());
        REQUIRE(connection.shutdown_calls == 1);
    }
}

TEST_CASE("Health status", "[monitor]") {
    EventBus bus;
    auto repo = std::make_shared<FakeRepository>();
    auto transport = std::make_shared<FakeTransport>();
    auto connections = std::make_shared<ConnectionMonitor>(bus);
    auto publisher = std::make_shared<RelayPublisher>(transport, connections, [](milliseconds) {});

    CopySettingsStore settings;
    TrackedWalletStore wallets;
    BlockingQueue<ObservedTrade> queue;
    StopToken stop;
    CopyTradeOrchestrator orchestrator(bus, std::make_shared<FakeWallet>(), std::make_shared<FakeExecutor>(),
                                       std::make_shared<RuleBasedCopyPolicy>(), "ServerWallet");
    MessagePipeline pipeline(queue, orchestrator, settings, stop);
    ScriptedConnection connection;
    FeedMonitor feed(connection, wallets, queue, stop,
                     [](const std::string&) { return std::optional<ObservedTrade>(); });

    HealthCheck health(publisher, repo, nullptr, connections, pipeline, feed);

    SECTION("Healthy") {
        connections->update_status(ConnectionType::WebSocket, ConnectionStatus::Connected);
        auto status = health.get_status();
        REQUIRE(status["ok"] == true);
        REQUIRE(status["pipeline"]["processed"] == 0);
        REQUIRE(status["connections"]["WebSocket"] == "Connected");
        REQUIRE_FALSE(status.contains("rpc"));
        REQUIRE(HealthCheck::http_status(status) == 200);
    }

    SECTION("Postgres down") {
        repo->healthy = false;
        auto status = health.get_status();
        REQUIRE(status["postgres"] == false);
        REQUIRE(status["ok"] == false);
        REQUIRE(HealthCheck::http_status(status) == 503);
    }

    SECTION("One status pings each backend once") {
        auto status = health.get_status();
        HealthCheck::http_status(status);
        REQUIRE(repo->ping_calls == 1);
        REQUIRE(transport->ping_calls == 1);
    }
}
