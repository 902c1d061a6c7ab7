#pragma once
#include <chrono>

class ExponentialBackoff {
public:
    ExponentialBackoff(std::chrono::milliseconds initial = std::chrono::seconds(1),
                       std::chrono::milliseconds max = std::chrono::seconds(60));

    // min(initial * 2^attempt, max)
    std::chrono::milliseconds delay_for(int attempt) const;

    // Delay for the current attempt, then advances the attempt counter
    std::chrono::milliseconds next_delay();

    // Resets the attempt counter after any successful operation
    void record_success();

    int attempts() const { return attempt_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    int attempt_ = 0;
};
