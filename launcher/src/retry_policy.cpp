#include "retry_policy.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

RetryPolicy::RetryPolicy(int max_attempts, std::chrono::milliseconds base_delay, double multiplier,
                         std::chrono::milliseconds max_delay)
    : max_attempts_(max_attempts),
      base_delay_(base_delay),
      multiplier_(multiplier),
      max_delay_(max_delay) {
    if (max_attempts_ < 1) {
        throw ValidationError("Retry policy needs at least one attempt");
    }
    if (base_delay_.count() < 0 || multiplier_ < 1.0) {
        throw ValidationError("Retry delay must be non-negative with a multiplier of at least 1");
    }
}

RetryPolicy RetryPolicy::fixed(int max_attempts, std::chrono::milliseconds delay) {
    return RetryPolicy(max_attempts, delay, 1.0, std::max(delay, std::chrono::milliseconds(0)));
}

std::chrono::milliseconds RetryPolicy::delay_after(int attempt) const {
    if (attempt <= 0) {
        return std::chrono::milliseconds(0);
    }

    double delay_ms = static_cast<double>(base_delay_.count()) * std::pow(multiplier_, attempt - 1);
    delay_ms = std::min(delay_ms, static_cast<double>(max_delay_.count()));

    return std::chrono::milliseconds(static_cast<long long>(delay_ms));
}
