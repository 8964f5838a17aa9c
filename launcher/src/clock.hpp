#pragma once
#include <chrono>

// Wall-clock time and blocking waits, injectable so tests can step through
// hour and day boundaries without sleeping.
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;
};
