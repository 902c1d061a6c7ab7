#include "feed_monitor.hpp"
#include <spdlog/spdlog.h>

FeedMonitor::FeedMonitor(FeedConnection& connection,
                         const TrackedWalletStore& wallets,
                         BlockingQueue<ObservedTrade>& queue,
                         const StopToken& stop,
                         FrameDecoder decoder)
    : connection_(connection)
    , wallets_(wallets)
    , queue_(queue)
    , stop_(stop)
    , decoder_(std::move(decoder))
{
}

void FeedMonitor::run() {
    spdlog::info("Feed monitor started");
    while (!stop_.stop_requested()) {
        auto wait = run_once();
        if (wait.count() > 0 && stop_.wait_for(wait)) {
            break;
        }
    }
    connection_.shutdown();
    spdlog::info("Feed monitor stopped ({} frames, {} trades queued)",
                 frames_received_.load(), trades_queued_.load());
}

std::chrono::milliseconds FeedMonitor::run_once() {
    auto revision = wallets_.revision();
    auto addresses = wallets_.active_addresses();

    if (addresses.empty()) {
        if (connection_.state() == ConnectionState::Connected ||
            connection_.state() == ConnectionState::Subscribed) {
            spdlog::info("No active wallets left, closing feed connection");
            connection_.close();
        }
        spdlog::debug("No wallets to monitor, waiting...");
        return EMPTY_WALLETS_POLL;
    }

    try {
        connection_.ensure_connection();
    } catch (const std::exception& e) {
        spdlog::error("Failed to ensure feed connection: {}", e.what());
        return RECONNECT_PAUSE;
    }

    try {
        connection_.subscribe(addresses);
    } catch (const std::exception& e) {
        spdlog::error("Failed to subscribe to {} wallet(s): {}", addresses.size(), e.what());
        return std::chrono::milliseconds(0);
    }

    drain(revision);
    return std::chrono::milliseconds(0);
}

void FeedMonitor::drain(uint64_t wallet_revision) {
    while (!stop_.stop_requested()) {
        if (wallets_.revision() != wallet_revision) {
            spdlog::info("Tracked wallets changed, restarting feed session");
            connection_.close();
            return;
        }

        FeedFrame frame = connection_.receive_message(RECEIVE_WAIT);
        switch (frame.kind) {
            case FeedFrame::Kind::None:
                break;
            case FeedFrame::Kind::Text:
                frames_received_++;
                handle_text(frame.payload);
                break;
            case FeedFrame::Kind::Close:
                spdlog::warn("Feed connection closed: {}", frame.payload);
                return;
            case FeedFrame::Kind::Error:
                spdlog::error("Feed connection error: {}", frame.payload);
                return;
        }
    }
}

void FeedMonitor::handle_text(const std::string& payload) {
    try {
        auto trade = decoder_(payload);
        if (!trade) {
            return;
        }
        spdlog::debug("Queued {} {} of {}", to_string(trade->transaction_type),
                      trade->signature, trade->token_address);
        queue_.push(std::move(*trade));
        trades_queued_++;
    } catch (const std::exception& e) {
        decode_errors_++;
        spdlog::warn("Dropping feed frame: {}", e.what());
    }
}
