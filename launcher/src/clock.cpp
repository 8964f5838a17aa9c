#include "clock.hpp"
#include <thread>

std::chrono::system_clock::time_point SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}
