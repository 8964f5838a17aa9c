#pragma once
#include "request_pipeline.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

// SQLite record store: the requests waiting to launch and the outcome of
// every request run. ":memory:" gives a private in-memory database.
class LaunchDatabase : public RequestSource, public OutcomeSink {
public:
    explicit LaunchDatabase(const std::string& db_path);
    ~LaunchDatabase() override;

    // False when the id is already registered; the stored request is kept.
    bool register_request(const LaunchRequest& request);

    LaunchRequest resolve(const std::string& request_id) override;
    void record(const Outcome& outcome) override;

    // Newest first
    std::vector<Outcome> recent_outcomes(int limit);

    bool is_healthy() const;

    // Non-copyable
    LaunchDatabase(const LaunchDatabase&) = delete;
    LaunchDatabase& operator=(const LaunchDatabase&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
