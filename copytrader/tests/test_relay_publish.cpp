#include <catch2/catch_test_macros.hpp>
#include "../src/redis_relay.hpp"
#include "../src/relay_codec.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"

using std::chrono::milliseconds;

TEST_CASE("Relay publish retries", "[relay]") {
    EventBus bus;
    auto monitor = std::make_shared<ConnectionMonitor>(bus);
    auto transport = std::make_shared<FakeTransport>();
    std::vector<milliseconds> sleeps;
    RelayPublisher publisher(transport, monitor, [&sleeps](milliseconds d) { sleeps.push_back(d); });

    SECTION("First attempt succeeds") {
        publisher.publish_settings_delete("abc");

        REQUIRE(transport->attempts == 1);
        REQUIRE(sleeps.empty());
        REQUIRE(transport->published.size() == 1);
        REQUIRE(transport->published[0].first == relay::SETTINGS_CHANNEL);
        REQUIRE(transport->published[0].second == R"({"settings_id":"abc"})");
    }

    SECTION("Transient failures are retried") {
        transport->failures_remaining = 2;
        publisher.publish_wallet_address_update("walletA", "add");

        REQUIRE(transport->attempts == 3);
        REQUIRE(sleeps.size() == 2);
        REQUIRE(transport->published.size() == 1);
        REQUIRE(transport->published[0].first == relay::TRACKED_WALLETS_CHANNEL);
        REQUIRE(monitor->status(ConnectionType::Redis) == ConnectionStatus::Connected);
    }

    SECTION("Persistent failure gives up after five retries") {
        transport->failures_remaining = -1;

        SolPriceUpdate update;
        update.price_usd = 150.0;
        REQUIRE_THROWS_AS(publisher.publish_sol_price_update(update), TransportError);

        REQUIRE(transport->attempts == 1 + RelayPublisher::MAX_RETRIES);
        REQUIRE(sleeps.size() == static_cast<size_t>(RelayPublisher::MAX_RETRIES));
        for (auto d : sleeps) {
            REQUIRE(d == milliseconds(1000));
        }
        REQUIRE(transport->published.empty());
        REQUIRE(monitor->status(ConnectionType::Redis) == ConnectionStatus::Error);
    }

    SECTION("Health follows the transport") {
        REQUIRE(publisher.is_healthy());
        transport->failures_remaining = -1;
        REQUIRE_FALSE(publisher.is_healthy());
    }
}

TEST_CASE("Relay inbound messages", "[relay]") {
    EventBus bus;
    auto sub = bus.subscribe();
    RelaySubscriber subscriber("redis://localhost:6379", bus, nullptr);

    SECTION("Decoded payloads are emitted on the bus") {
        REQUIRE(subscriber.handle_message(relay::TRACKED_WALLETS_CHANNEL,
                                          relay::encode_wallet_address_update("WalletA", "add")));
        auto event = sub->try_recv();
        REQUIRE(event.has_value());
        REQUIRE(event_type(*event) == event_tags::WALLET_STATE_CHANGE);
    }

    SECTION("Malformed payloads are dropped") {
        REQUIRE_FALSE(subscriber.handle_message(relay::SETTINGS_CHANNEL, "{oops"));
        REQUIRE(subscriber.received() == 1);
        REQUIRE(subscriber.dropped() == 1);
        REQUIRE_FALSE(sub->try_recv().has_value());
    }

    SECTION("Deletes are accepted but not emitted") {
        REQUIRE_FALSE(subscriber.handle_message(relay::SETTINGS_CHANNEL, relay::encode_settings_delete("abc")));
        REQUIRE(subscriber.dropped() == 0);
    }

    SECTION("Keep-alive is idle before start") {
        REQUIRE_FALSE(subscriber.keep_alive_running());
    }
}
