#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Everything the launch queue needs to survive a restart
struct QueueState {
    std::vector<std::string> pending;
    int launches_this_hour = 0;
    std::chrono::system_clock::time_point hour_reset_time;
    uint64_t budget_used_lamports = 0;
    std::chrono::system_clock::time_point budget_reset_time;
    uint64_t total_processed = 0;
    uint64_t total_failed = 0;
    std::chrono::system_clock::time_point last_saved;

    // Absent fields read as zero or empty so older files stay loadable
    static QueueState from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

class QueueStore {
public:
    explicit QueueStore(std::string path);

    const std::string& path() const { return path_; }

    // Empty when no file exists yet. Throws PersistenceError on unreadable
    // or malformed content.
    std::optional<QueueState> load() const;

    // Atomic replace of the file. Throws PersistenceError.
    void save(const QueueState& state) const;

private:
    std::string path_;
};
