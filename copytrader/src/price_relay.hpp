#pragma once

#include "chain_data.hpp"
#include "event_bus.hpp"
#include "redis_relay.hpp"
#include "stop_token.hpp"
#include "wallet_state.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <thread>

// Prices every bonding-curve trade seen on the bus from the curve account
// on chain and publishes the result on the price relay channel.
class PriceRelay {
public:
    PriceRelay(EventBus& bus, std::shared_ptr<ChainDataAccessor> chain,
               std::shared_ptr<RelayPublisher> publisher, const SolPriceTracker& sol_price);
    ~PriceRelay();

    void start();
    void stop();

    std::optional<PriceUpdate> price_from_trade(const ObservedTrade& trade);

    // Publishes for tracked-wallet-trade events; failures are logged only.
    void handle_event(const Event& event);

    uint64_t published() const { return published_; }

private:
    void run();

    std::shared_ptr<EventSubscription> subscription_;
    std::shared_ptr<ChainDataAccessor> chain_;
    std::shared_ptr<RelayPublisher> publisher_;
    const SolPriceTracker& sol_price_;
    StopToken stop_;
    std::thread thread_;
    std::atomic<uint64_t> published_{0};
};
