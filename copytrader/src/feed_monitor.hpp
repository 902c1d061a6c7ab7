#pragma once

#include "blocking_queue.hpp"
#include "models.hpp"
#include "stop_token.hpp"
#include "wallet_state.hpp"
#include "ws_connection.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// Keeps the feed subscribed to the active tracked wallets and queues every
// decoded trade for the pipeline.
class FeedMonitor {
public:
    using FrameDecoder = std::function<std::optional<ObservedTrade>(const std::string&)>;

    static constexpr std::chrono::milliseconds EMPTY_WALLETS_POLL{5000};
    static constexpr std::chrono::milliseconds RECONNECT_PAUSE{1000};
    static constexpr std::chrono::milliseconds RECEIVE_WAIT{100};

    FeedMonitor(FeedConnection& connection,
                const TrackedWalletStore& wallets,
                BlockingQueue<ObservedTrade>& queue,
                const StopToken& stop,
                FrameDecoder decoder);

    // Runs until a stop is requested, then shuts the connection down
    void run();

    // One connect -> subscribe -> drain cycle. Returns how long to wait
    // before the next cycle.
    std::chrono::milliseconds run_once();

    uint64_t frames_received() const { return frames_received_; }
    uint64_t trades_queued() const { return trades_queued_; }
    uint64_t decode_errors() const { return decode_errors_; }

private:
    void drain(uint64_t wallet_revision);
    void handle_text(const std::string& payload);

    FeedConnection& connection_;
    const TrackedWalletStore& wallets_;
    BlockingQueue<ObservedTrade>& queue_;
    const StopToken& stop_;
    FrameDecoder decoder_;
    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> trades_queued_{0};
    std::atomic<uint64_t> decode_errors_{0};
};
