#include "backoff.hpp"
#include <algorithm>

ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds initial, std::chrono::milliseconds max)
    : initial_(initial), max_(std::max(initial, max)) {}

std::chrono::milliseconds ExponentialBackoff::delay_for(int attempt) const {
    if (attempt < 0) attempt = 0;
    auto delay = initial_;
    for (int i = 0; i < attempt; i++) {
        if (delay >= max_) {
            return max_;
        }
        delay *= 2;
    }
    return std::min(delay, max_);
}

std::chrono::milliseconds ExponentialBackoff::next_delay() {
    auto delay = delay_for(attempt_);
    attempt_++;
    return delay;
}

void ExponentialBackoff::record_success() {
    attempt_ = 0;
}
