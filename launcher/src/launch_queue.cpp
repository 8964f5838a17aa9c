#include "launch_queue.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <optional>

namespace {

constexpr std::chrono::milliseconds WAIT_SLICE{1000};

std::chrono::milliseconds remaining_until(std::chrono::system_clock::time_point deadline,
                                          std::chrono::system_clock::time_point now) {
    if (deadline <= now) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
}

} // namespace

const char* to_string(QueueMode mode) {
    switch (mode) {
        case QueueMode::Idle: return "idle";
        case QueueMode::Processing: return "processing";
        case QueueMode::Paused: return "paused";
    }
    return "idle";
}

LaunchQueue::LaunchQueue(QueueLimits limits, QueueStore& store, LaunchRunner& runner, Clock& clock, bool autostart)
    : limits_(limits), store_(store), runner_(runner), clock_(clock), autostart_(autostart) {
    if (limits_.hourly_limit < 1) {
        throw ValidationError("Hourly launch limit must be positive");
    }
    if (limits_.daily_budget_lamports == 0) {
        throw ValidationError("Daily budget must be positive");
    }

    auto now = clock_.now();
    try {
        if (auto loaded = store_.load()) {
            state_ = std::move(*loaded);
            spdlog::info("Loaded queue with {} pending request(s) from {}", state_.pending.size(), store_.path());
        } else {
            state_.hour_reset_time = now + std::chrono::hours(1);
            state_.budget_reset_time = util::next_utc_midnight(now);
        }
    } catch (const PersistenceError& e) {
        spdlog::error("Could not load queue state, starting empty: {}", e.what());
        persistence_healthy_ = false;
        state_ = QueueState{};
        state_.hour_reset_time = now + std::chrono::hours(1);
        state_.budget_reset_time = util::next_utc_midnight(now);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (autostart_ && !state_.pending.empty()) {
        spdlog::info("Resuming {} pending request(s)", state_.pending.size());
        start_worker_locked();
    }
}

LaunchQueue::~LaunchQueue() {
    stop();
}

bool LaunchQueue::enqueue(const std::string& id) {
    if (util::trim(id).empty()) {
        throw ValidationError("Request id is required");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(state_.pending.begin(), state_.pending.end(), id) != state_.pending.end()) {
        spdlog::debug("Request {} already queued", id);
        return false;
    }

    state_.pending.push_back(id);
    persist_locked();
    spdlog::info("Queued request {} (queue size: {})", id, state_.pending.size());

    if (autostart_ && !paused_ && !processing_ && !stopping_) {
        start_worker_locked();
    }
    return true;
}

void LaunchQueue::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
    spdlog::info("Queue paused ({} pending)", state_.pending.size());
}

void LaunchQueue::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = false;
    spdlog::info("Queue resumed ({} pending)", state_.pending.size());
    if (autostart_ && !state_.pending.empty() && !processing_ && !stopping_) {
        start_worker_locked();
    }
}

size_t LaunchQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = state_.pending.size();
    state_.pending.clear();
    persist_locked();
    spdlog::info("Queue cleared, {} request(s) dropped", removed);
    return removed;
}

QueueStatus LaunchQueue::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueStatus status;
    status.queue_size = state_.pending.size();
    status.processing = processing_;
    status.paused = paused_;
    status.launches_this_hour = state_.launches_this_hour;
    status.hourly_limit = limits_.hourly_limit;
    status.budget_used_sol = util::lamports_to_sol(static_cast<int64_t>(state_.budget_used_lamports));
    status.daily_budget_sol = util::lamports_to_sol(static_cast<int64_t>(limits_.daily_budget_lamports));
    status.total_processed = state_.total_processed;
    status.total_failed = state_.total_failed;
    status.persistence_healthy = persistence_healthy_;
    status.hour_reset_time = util::format_iso8601(state_.hour_reset_time);
    status.budget_reset_time = util::format_iso8601(state_.budget_reset_time);
    return status;
}

std::vector<std::string> LaunchQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.pending;
}

QueueMode LaunchQueue::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_) {
        return QueueMode::Paused;
    }
    return processing_ ? QueueMode::Processing : QueueMode::Idle;
}

void LaunchQueue::process() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (processing_) {
            return;
        }
        processing_ = true;
    }
    run_loop();
}

void LaunchQueue::run_loop() {
    spdlog::info("Queue processing started");

    while (true) {
        std::optional<std::string> next;
        std::chrono::milliseconds gate_wait{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (paused_ || stopping_ || state_.pending.empty()) {
                processing_ = false;
                spdlog::info("Queue processing stopped ({}, {} pending)",
                             paused_ || stopping_ ? "paused" : "idle", state_.pending.size());
                return;
            }

            auto now = clock_.now();
            reset_expired_counters_locked(now);

            if (state_.launches_this_hour >= limits_.hourly_limit) {
                gate_wait = std::min<std::chrono::milliseconds>(remaining_until(state_.hour_reset_time, now),
                                                                limits_.gate_max_sleep);
                spdlog::info("Hourly limit reached ({}/{}), waiting {}s", state_.launches_this_hour,
                             limits_.hourly_limit, gate_wait.count() / 1000);
            } else if (state_.budget_used_lamports >= limits_.daily_budget_lamports) {
                gate_wait = std::min<std::chrono::milliseconds>(remaining_until(state_.budget_reset_time, now),
                                                                limits_.gate_max_sleep);
                spdlog::info("Daily budget reached ({:.4f}/{:.4f} SOL), waiting {}s",
                             util::lamports_to_sol(static_cast<int64_t>(state_.budget_used_lamports)),
                             util::lamports_to_sol(static_cast<int64_t>(limits_.daily_budget_lamports)),
                             gate_wait.count() / 1000);
            } else {
                // Off the list and on disk before any network call
                next = state_.pending.front();
                state_.pending.erase(state_.pending.begin());
                persist_locked();
                spdlog::info("Processing request {} ({} remaining)", *next, state_.pending.size());
            }
        }

        if (!next) {
            wait(std::max(gate_wait, std::chrono::milliseconds(1)));
            continue;
        }

        Outcome outcome;
        try {
            outcome = runner_.run(*next);
        } catch (const std::exception& e) {
            outcome = Outcome::failure(*next, e.what());
            outcome.timestamp = util::format_iso8601(clock_.now());
        }
        record_outcome(outcome);

        bool more = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            more = !state_.pending.empty() && !paused_;
        }
        if (more && limits_.launch_delay.count() > 0) {
            spdlog::info("Waiting {}s before next launch", limits_.launch_delay.count());
            wait(limits_.launch_delay);
        }
    }
}

void LaunchQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = true;
        stopping_ = true;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

void LaunchQueue::start_worker_locked() {
    // processing_ is false, so any previous worker has left its loop
    if (worker_.joinable()) {
        worker_.join();
    }
    processing_ = true;
    worker_ = std::thread([this] { run_loop(); });
}

void LaunchQueue::reset_expired_counters_locked(std::chrono::system_clock::time_point now) {
    if (now >= state_.hour_reset_time) {
        spdlog::debug("Hourly counter reset ({} launches in last window)", state_.launches_this_hour);
        state_.launches_this_hour = 0;
        state_.hour_reset_time = now + std::chrono::hours(1);
        persist_locked();
    }
    if (now >= state_.budget_reset_time) {
        spdlog::debug("Daily budget reset ({} lamports used)", state_.budget_used_lamports);
        state_.budget_used_lamports = 0;
        state_.budget_reset_time = util::next_utc_midnight(now);
        persist_locked();
    }
}

void LaunchQueue::persist_locked() {
    state_.last_saved = clock_.now();
    try {
        store_.save(state_);
        persistence_healthy_ = true;
    } catch (const PersistenceError& e) {
        // Keep going on in-memory state; a crash now would lose the queue
        spdlog::error("Queue state not persisted, operator attention needed: {}", e.what());
        persistence_healthy_ = false;
    }
}

void LaunchQueue::wait(std::chrono::milliseconds duration) {
    auto deadline = clock_.now() + duration;
    while (!stopping_) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (paused_) {
                return;
            }
        }
        auto remaining = remaining_until(deadline, clock_.now());
        if (remaining.count() == 0) {
            return;
        }
        clock_.sleep_for(std::min(remaining, WAIT_SLICE));
    }
}

void LaunchQueue::record_outcome(const Outcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_expired_counters_locked(clock_.now());

    // An attempt counts against the hour whatever its result
    state_.launches_this_hour++;
    state_.total_processed++;
    if (!outcome.success) {
        state_.total_failed++;
    }
    if (outcome.sol_spent > 0) {
        uint64_t headroom = std::numeric_limits<uint64_t>::max() - state_.budget_used_lamports;
        state_.budget_used_lamports += std::min(outcome.sol_spent, headroom);
    }
    persist_locked();

    if (outcome.success) {
        spdlog::info("Request {} done: {} (spent {:.6f} SOL, hour {}/{}, budget {:.4f}/{:.4f} SOL)",
                     outcome.request_id, to_string(outcome.status),
                     util::lamports_to_sol(static_cast<int64_t>(outcome.sol_spent)), state_.launches_this_hour,
                     limits_.hourly_limit, util::lamports_to_sol(static_cast<int64_t>(state_.budget_used_lamports)),
                     util::lamports_to_sol(static_cast<int64_t>(limits_.daily_budget_lamports)));
    } else {
        spdlog::error("Request {} failed: {}", outcome.request_id, outcome.error);
    }
}
