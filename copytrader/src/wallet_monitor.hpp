#pragma once

#include "event_bus.hpp"
#include "feed_monitor.hpp"
#include "message_pipeline.hpp"
#include "stop_token.hpp"
#include "store_pg.hpp"
#include "wallet_state.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

// Owns the long-running tasks of one copy trader instance: the feed
// monitor, the message pipeline and the loop applying bus events to the
// in-memory wallet and settings state.
class WalletMonitor {
public:
    static constexpr std::chrono::milliseconds EVENT_WAIT{1000};
    static constexpr std::chrono::milliseconds DRAIN_PAUSE{1000};

    WalletMonitor(std::shared_ptr<WalletRepository> repo,
                  EventBus& bus,
                  TrackedWalletStore& wallets,
                  CopySettingsStore& settings,
                  SolPriceTracker& sol_price,
                  MessagePipeline& pipeline,
                  FeedMonitor& feed,
                  StopToken& stop,
                  std::string user_id);
    ~WalletMonitor();

    // Ensures the server user exists and loads its wallets and settings.
    // Throws InitializationError.
    void initialize();

    void start();
    void stop();

    // False once the pipeline or the feed task has exited on its own
    bool tasks_alive() const;

    void handle_event(const Event& event);

    uint64_t logs_persisted() const { return logs_persisted_; }

private:
    void event_loop();

    std::shared_ptr<WalletRepository> repo_;
    std::shared_ptr<EventSubscription> subscription_;
    TrackedWalletStore& wallets_;
    CopySettingsStore& settings_;
    SolPriceTracker& sol_price_;
    MessagePipeline& pipeline_;
    FeedMonitor& feed_;
    StopToken& stop_;
    std::string user_id_;

    std::thread pipeline_thread_;
    std::thread feed_thread_;
    std::thread event_thread_;
    std::atomic<bool> pipeline_finished_{false};
    std::atomic<bool> feed_finished_{false};
    std::atomic<bool> started_{false};
    std::atomic<uint64_t> logs_persisted_{0};
};
