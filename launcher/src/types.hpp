#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

// Fallbacks for the optional request fields
struct LaunchDefaults {
    double initial_buy_sol = 0.01;
    double slippage_pct = 10.0;
    double priority_fee_sol = 0.0001;
};

struct LaunchRequest {
    static constexpr size_t MAX_NAME_LENGTH = 32;
    static constexpr size_t MAX_SYMBOL_LENGTH = 10;
    static constexpr size_t MAX_URI_LENGTH = 200;

    std::string id;
    std::string name;
    std::string symbol;
    std::string metadata_url;
    double initial_buy_sol = 0.0;
    double slippage_pct = 0.0;
    double priority_fee_sol = 0.0;

    // Throws ValidationError naming the first bad field
    void validate() const;

    static LaunchRequest from_json(const nlohmann::json& j, const LaunchDefaults& defaults);
    nlohmann::json to_json() const;
};

enum class OutcomeStatus { Launched, Sold, Failed };

const char* to_string(OutcomeStatus status);
OutcomeStatus outcome_status_from_string(const std::string& text);

// Result of one request. Amounts are lamports; profit_loss may be negative.
struct Outcome {
    std::string request_id;
    bool success = false;
    OutcomeStatus status = OutcomeStatus::Failed;
    std::string token_address;
    std::string deploy_signature;
    std::string sell_signature;
    uint64_t sol_spent = 0;
    uint64_t sol_received = 0;
    int64_t profit_loss = 0;
    std::string error;
    std::string timestamp;

    // Leaves timestamp empty for the caller to stamp from its clock
    static Outcome failure(const std::string& request_id, const std::string& reason);

    nlohmann::json to_json() const;
};

struct QueueStatus {
    size_t queue_size = 0;
    bool processing = false;
    bool paused = false;
    int launches_this_hour = 0;
    int hourly_limit = 0;
    double budget_used_sol = 0.0;
    double daily_budget_sol = 0.0;
    uint64_t total_processed = 0;
    uint64_t total_failed = 0;
    bool persistence_healthy = true;
    std::string hour_reset_time;
    std::string budget_reset_time;

    double success_rate() const;
    nlohmann::json to_json() const;
};
