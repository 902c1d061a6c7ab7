#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared cancellation flag. Loops check it at every suspension point and
// sleep through wait_for so a stop request wakes them immediately.
class StopToken {
public:
    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }

    bool stop_requested() const {
        return stopped_.load();
    }

    // Returns true when a stop was requested before the timeout elapsed.
    bool wait_for(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stopped_.load(); });
    }

private:
    std::atomic<bool> stopped_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};
