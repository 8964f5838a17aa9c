#pragma once
#include "clock.hpp"
#include "queue_store.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Executes one request end to end; implemented by RequestPipeline.
class LaunchRunner {
public:
    virtual ~LaunchRunner() = default;
    virtual Outcome run(const std::string& request_id) = 0;
};

struct QueueLimits {
    int hourly_limit = 10;
    uint64_t daily_budget_lamports = 1000000000ULL;
    std::chrono::seconds launch_delay{120};
    // Longest single wait while gated on the hourly or daily limit
    std::chrono::seconds gate_max_sleep{300};
};

enum class QueueMode { Idle, Processing, Paused };

const char* to_string(QueueMode mode);

// Persisted FIFO of request ids drained one at a time under an hourly launch
// limit and a daily spend budget. A single loop runs requests; every state
// change is written to the store before the loop moves on.
class LaunchQueue {
public:
    // With autostart the loop runs on a worker thread whenever work arrives;
    // without it the owner drives process() directly.
    LaunchQueue(QueueLimits limits, QueueStore& store, LaunchRunner& runner, Clock& clock, bool autostart = true);
    ~LaunchQueue();

    LaunchQueue(const LaunchQueue&) = delete;
    LaunchQueue& operator=(const LaunchQueue&) = delete;

    // False when id is already pending
    bool enqueue(const std::string& id);

    void pause();
    void resume();
    // Drops every pending id; returns how many were removed
    size_t clear();

    QueueStatus status() const;
    std::vector<std::string> pending() const;
    QueueMode mode() const;

    // Drains until empty or paused, on the calling thread
    void process();

    // Pauses and joins the worker
    void stop();

private:
    void run_loop();
    void start_worker_locked();
    void reset_expired_counters_locked(std::chrono::system_clock::time_point now);
    void persist_locked();
    // Clock-driven wait that returns early once paused or stopping
    void wait(std::chrono::milliseconds duration);
    void record_outcome(const Outcome& outcome);

    QueueLimits limits_;
    QueueStore& store_;
    LaunchRunner& runner_;
    Clock& clock_;
    bool autostart_;

    mutable std::mutex mutex_;
    QueueState state_;
    bool paused_ = false;
    bool processing_ = false;
    bool persistence_healthy_ = true;
    std::atomic<bool> stopping_{false};
    std::thread worker_;
};
