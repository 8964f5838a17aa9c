#include "queue_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace {

std::chrono::system_clock::time_point read_time(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string() || j.at(key).get<std::string>().empty()) {
        return {};
    }
    return util::parse_iso8601(j.at(key).get<std::string>());
}

} // namespace

QueueState QueueState::from_json(const nlohmann::json& j) {
    QueueState state;
    if (j.contains("pending")) {
        state.pending = j.at("pending").get<std::vector<std::string>>();
    }
    state.launches_this_hour = j.value("launches_this_hour", 0);
    state.hour_reset_time = read_time(j, "hour_reset_time");
    state.budget_used_lamports = j.value("budget_used_lamports", static_cast<uint64_t>(0));
    state.budget_reset_time = read_time(j, "budget_reset_time");
    state.total_processed = j.value("total_processed", static_cast<uint64_t>(0));
    state.total_failed = j.value("total_failed", static_cast<uint64_t>(0));
    state.last_saved = read_time(j, "last_saved");
    return state;
}

nlohmann::json QueueState::to_json() const {
    nlohmann::json j;
    j["pending"] = pending;
    j["launches_this_hour"] = launches_this_hour;
    j["hour_reset_time"] = util::format_iso8601(hour_reset_time);
    j["budget_used_lamports"] = budget_used_lamports;
    j["budget_reset_time"] = util::format_iso8601(budget_reset_time);
    j["total_processed"] = total_processed;
    j["total_failed"] = total_failed;
    j["last_saved"] = util::format_iso8601(last_saved);
    return j;
}

QueueStore::QueueStore(std::string path) : path_(std::move(path)) {
}

std::optional<QueueState> QueueStore::load() const {
    std::ifstream in(path_);
    if (!in) {
        spdlog::debug("No queue file at {}", path_);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        return QueueState::from_json(nlohmann::json::parse(buffer.str()));
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("Malformed queue file " + path_ + ": " + e.what());
    } catch (const DecodeError& e) {
        throw PersistenceError("Malformed queue file " + path_ + ": " + e.what());
    }
}

void QueueStore::save(const QueueState& state) const {
    util::write_file_atomic(path_, state.to_json().dump(2));
}
