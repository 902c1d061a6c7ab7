#pragma once

#include "connection_monitor.hpp"
#include "event_bus.hpp"
#include "models.hpp"
#include "stop_token.hpp"
#include <sw/redis++/redis++.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

class RelayTransport {
public:
    virtual ~RelayTransport() = default;
    virtual void publish(const std::string& channel, const std::string& message) = 0;
    virtual bool ping() = 0;
};

class RedisTransport : public RelayTransport {
public:
    explicit RedisTransport(const std::string& redis_url);

    void publish(const std::string& channel, const std::string& message) override;
    bool ping() override;

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};

// Outbound half of the relay. Each publish is retried MAX_RETRIES times,
// RECONNECT_DELAY apart, before a TransportError is raised.
class RelayPublisher {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static constexpr int MAX_RETRIES = 5;
    static constexpr std::chrono::milliseconds RECONNECT_DELAY{1000};

    RelayPublisher(std::shared_ptr<RelayTransport> transport,
                   std::shared_ptr<ConnectionMonitor> monitor,
                   Sleeper sleeper = {});

    void publish_settings_update(const CopyTradeSettings& settings);
    void publish_settings_delete(const std::string& settings_id);
    void publish_tracked_wallet_update(const std::string& wallet_address, const std::string& action,
                                       bool is_active, const std::optional<std::string>& id);
    void publish_wallet_address_update(const std::string& wallet_address, const std::string& action);
    void publish_price_update(const PriceUpdate& update);
    void publish_sol_price_update(const SolPriceUpdate& update);

    bool is_healthy();

private:
    void publish_with_retry(const char* channel, const std::string& message, const char* what);

    std::shared_ptr<RelayTransport> transport_;
    std::shared_ptr<ConnectionMonitor> monitor_;
    Sleeper sleeper_;
};

// Inbound half of the relay: one subscription over all relay channels on
// its own connection, re-emitting decoded payloads on the event bus.
class RelaySubscriber {
public:
    static constexpr std::chrono::seconds KEEP_ALIVE_INTERVAL{30};
    static constexpr std::chrono::seconds RESUBSCRIBE_DELAY{1};

    RelaySubscriber(const std::string& redis_url, EventBus& bus,
                    std::shared_ptr<ConnectionMonitor> monitor);
    ~RelaySubscriber();

    void start();
    void stop();

    // Decodes one inbound message and emits it. Malformed payloads are
    // logged and dropped. Returns true when an event was emitted.
    bool handle_message(const std::string& channel, const std::string& payload);

    bool keep_alive_running() const { return keep_alive_running_; }
    uint64_t received() const { return received_; }
    uint64_t dropped() const { return dropped_; }

private:
    void consume_loop();
    void keep_alive_loop();
    sw::redis::Subscriber make_subscriber();

    std::string redis_url_;
    EventBus& bus_;
    std::shared_ptr<ConnectionMonitor> monitor_;
    std::shared_ptr<sw::redis::Redis> redis_;
    StopToken stop_;
    std::thread consume_thread_;
    std::thread keep_alive_thread_;
    std::atomic<bool> keep_alive_running_{false};
    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> dropped_{0};
};
