#pragma once

#include "blocking_queue.hpp"
#include "models.hpp"
#include "orchestrator.hpp"
#include "stop_token.hpp"
#include "wallet_state.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>

// Single consumer draining observed trades in arrival order.
class MessagePipeline {
public:
    static constexpr std::chrono::milliseconds IDLE_TICK{100};

    MessagePipeline(BlockingQueue<ObservedTrade>& queue,
                    CopyTradeOrchestrator& orchestrator,
                    const CopySettingsStore& settings,
                    const StopToken& stop);

    // Runs until a stop is requested
    void run();

    // Waits up to idle_tick for one trade and handles it. Failures are
    // logged and counted. Returns true when a trade was taken off the queue.
    bool process_next(std::chrono::milliseconds idle_tick = IDLE_TICK);

    uint64_t processed() const { return processed_; }
    uint64_t failed() const { return failed_; }
    size_t queued() const { return queue_.size(); }

private:
    BlockingQueue<ObservedTrade>& queue_;
    CopyTradeOrchestrator& orchestrator_;
    const CopySettingsStore& settings_;
    const StopToken& stop_;
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> failed_{0};
};
