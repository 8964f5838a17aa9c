#pragma once
#include <chrono>

// Bounded retry: max attempts with a fixed or growing delay between them.
class RetryPolicy {
public:
    RetryPolicy(int max_attempts, std::chrono::milliseconds base_delay, double multiplier = 1.0,
                std::chrono::milliseconds max_delay = std::chrono::minutes(5));

    int max_attempts() const { return max_attempts_; }

    // Delay to wait after the given failed attempt (1-based)
    std::chrono::milliseconds delay_after(int attempt) const;

    static RetryPolicy fixed(int max_attempts, std::chrono::milliseconds delay);

private:
    int max_attempts_;
    std::chrono::milliseconds base_delay_;
    double multiplier_;
    std::chrono::milliseconds max_delay_;
};
