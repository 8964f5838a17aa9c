#include "types.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cmath>

namespace {

void require_text(const std::string& field, const std::string& value, size_t max_length) {
    if (util::trim(value).empty()) {
        throw ValidationError(field + " is required");
    }
    if (value.size() > max_length) {
        throw ValidationError(field + " exceeds " + std::to_string(max_length) + " bytes");
    }
}

void require_amount(const std::string& field, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ValidationError(field + " must be a non-negative number");
    }
}

} // namespace

void LaunchRequest::validate() const {
    if (util::trim(id).empty()) {
        throw ValidationError("id is required");
    }
    require_text("name", name, MAX_NAME_LENGTH);
    require_text("symbol", symbol, MAX_SYMBOL_LENGTH);
    require_text("metadata_url", metadata_url, MAX_URI_LENGTH);
    require_amount("initial_buy_sol", initial_buy_sol);
    require_amount("priority_fee_sol", priority_fee_sol);
    if (!std::isfinite(slippage_pct) || slippage_pct < 0.0 || slippage_pct > 100.0) {
        throw ValidationError("slippage_pct must be between 0 and 100");
    }
}

LaunchRequest LaunchRequest::from_json(const nlohmann::json& j, const LaunchDefaults& defaults) {
    LaunchRequest req;
    try {
        req.id = j.at("id").get<std::string>();
        req.name = j.at("name").get<std::string>();
        req.symbol = j.at("symbol").get<std::string>();
        req.metadata_url = j.at("metadata_url").get<std::string>();
        req.initial_buy_sol = j.value("initial_buy_sol", defaults.initial_buy_sol);
        req.slippage_pct = j.value("slippage_pct", defaults.slippage_pct);
        req.priority_fee_sol = j.value("priority_fee_sol", defaults.priority_fee_sol);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("Malformed launch request: ") + e.what());
    }
    return req;
}

nlohmann::json LaunchRequest::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["symbol"] = symbol;
    j["metadata_url"] = metadata_url;
    j["initial_buy_sol"] = initial_buy_sol;
    j["slippage_pct"] = slippage_pct;
    j["priority_fee_sol"] = priority_fee_sol;
    return j;
}

const char* to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Launched: return "launched";
        case OutcomeStatus::Sold: return "sold";
        case OutcomeStatus::Failed: return "failed";
    }
    return "failed";
}

OutcomeStatus outcome_status_from_string(const std::string& text) {
    if (text == "launched") return OutcomeStatus::Launched;
    if (text == "sold") return OutcomeStatus::Sold;
    if (text == "failed") return OutcomeStatus::Failed;
    throw DecodeError("Unknown outcome status: " + text);
}

Outcome Outcome::failure(const std::string& request_id, const std::string& reason) {
    Outcome outcome;
    outcome.request_id = request_id;
    outcome.success = false;
    outcome.status = OutcomeStatus::Failed;
    outcome.error = reason;
    return outcome;
}

nlohmann::json Outcome::to_json() const {
    nlohmann::json j;
    j["request_id"] = request_id;
    j["success"] = success;
    j["status"] = to_string(status);
    j["token_address"] = token_address;
    j["deploy_signature"] = deploy_signature;
    j["sell_signature"] = sell_signature;
    j["sol_spent"] = util::lamports_to_sol(static_cast<int64_t>(sol_spent));
    j["sol_received"] = util::lamports_to_sol(static_cast<int64_t>(sol_received));
    j["profit_loss"] = util::lamports_to_sol(profit_loss);
    if (!error.empty()) {
        j["error"] = error;
    }
    j["timestamp"] = timestamp;
    return j;
}

double QueueStatus::success_rate() const {
    if (total_processed == 0) {
        return 0.0;
    }
    return static_cast<double>(total_processed - total_failed) / static_cast<double>(total_processed) * 100.0;
}

nlohmann::json QueueStatus::to_json() const {
    nlohmann::json j;
    j["queue_size"] = queue_size;
    j["processing"] = processing;
    j["paused"] = paused;
    j["launches_this_hour"] = launches_this_hour;
    j["hourly_limit"] = hourly_limit;
    j["budget_used_sol"] = budget_used_sol;
    j["daily_budget_sol"] = daily_budget_sol;
    j["total_processed"] = total_processed;
    j["total_failed"] = total_failed;
    j["success_rate"] = success_rate();
    j["persistence_healthy"] = persistence_healthy;
    j["hour_reset_time"] = hour_reset_time;
    j["budget_reset_time"] = budget_reset_time;
    return j;
}
