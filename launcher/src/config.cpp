#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

using namespace util;

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", "launcher");
    config.log_level = get_env_var("LOG_LEVEL", "info");

    // Solana
    config.solana_rpc_url = get_env_var("SOLANA_RPC_URL", "https://api.mainnet-beta.solana.com");
    config.private_key = get_env_var("SOLANA_PRIVATE_KEY", get_env_var("PRIVATE_KEY"));

    // Queue gates
    config.hourly_launch_limit = get_env_int("HOURLY_LAUNCH_LIMIT", 10);
    config.daily_budget_sol = get_env_double("DAILY_BUDGET_SOL", 1.0);
    config.launch_delay_seconds = get_env_int("LAUNCH_DELAY_SECONDS", 120);
    config.gate_max_sleep_seconds = get_env_int("GATE_MAX_SLEEP_SECONDS", 300);

    // Launch defaults
    config.default_initial_buy_sol = get_env_double("DEFAULT_INITIAL_BUY_SOL", 0.01);
    config.default_slippage_pct = get_env_double("DEFAULT_SLIPPAGE_PCT", 10.0);
    config.default_priority_fee_sol = get_env_double("DEFAULT_PRIORITY_FEE_SOL", 0.0001);

    // Sell
    config.sell_delay_seconds = get_env_int("SELL_DELAY_SECONDS", 15);
    config.sell_slippage_pct = get_env_double("SELL_SLIPPAGE_PCT", 5.0);
    config.sell_min_out_guard = get_env_bool("SELL_MIN_OUT_GUARD", false);

    // Transaction shaping
    config.buy_fee_bps = get_env_int("BUY_FEE_BPS", 0);
    config.create_compute_units = get_env_int("CREATE_COMPUTE_UNITS", 300000);
    config.sell_compute_units = get_env_int("SELL_COMPUTE_UNITS", 100000);

    // Confirmation and visibility
    config.confirm_timeout_seconds = get_env_int("CONFIRM_TIMEOUT_SECONDS", 60);
    config.account_visible_attempts = get_env_int("ACCOUNT_VISIBLE_ATTEMPTS", 5);
    config.account_visible_delay_ms = get_env_int("ACCOUNT_VISIBLE_DELAY_MS", 2000);

    // Storage
    config.queue_file = get_env_var("QUEUE_FILE", "queue.json");
    config.db_path = get_env_var("DB_PATH", "launcher.db");

    // Health
    config.health_host = get_env_var("HEALTH_HOST", "0.0.0.0");
    config.health_port = get_env_int("HEALTH_PORT", 10000);

    return config;
}

namespace {

void require_non_negative(const char* name, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ValidationError(std::string(name) + " must be non-negative");
    }
}

void require_percentage(const char* name, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 100.0) {
        throw ValidationError(std::string(name) + " must be between 0 and 100");
    }
}

} // namespace

void Config::validate() const {
    if (private_key.empty()) {
        throw ValidationError("SOLANA_PRIVATE_KEY (or PRIVATE_KEY) is required");
    }

    if (!starts_with(solana_rpc_url, "https://") && !starts_with(solana_rpc_url, "http://")) {
        throw ValidationError("SOLANA_RPC_URL must be an http or https URL");
    }

    if (hourly_launch_limit < 1) {
        throw ValidationError("HOURLY_LAUNCH_LIMIT must be a positive integer");
    }

    if (!std::isfinite(daily_budget_sol) || daily_budget_sol <= 0.0) {
        throw ValidationError("DAILY_BUDGET_SOL must be positive");
    }

    if (launch_delay_seconds < 0) {
        throw ValidationError("LAUNCH_DELAY_SECONDS must be non-negative");
    }

    if (gate_max_sleep_seconds < 1) {
        throw ValidationError("GATE_MAX_SLEEP_SECONDS must be at least 1");
    }

    require_non_negative("DEFAULT_INITIAL_BUY_SOL", default_initial_buy_sol);
    require_percentage("DEFAULT_SLIPPAGE_PCT", default_slippage_pct);
    require_non_negative("DEFAULT_PRIORITY_FEE_SOL", default_priority_fee_sol);

    if (sell_delay_seconds < 0) {
        throw ValidationError("SELL_DELAY_SECONDS must be non-negative");
    }
    require_percentage("SELL_SLIPPAGE_PCT", sell_slippage_pct);

    if (buy_fee_bps < 0 || buy_fee_bps > 10000) {
        throw ValidationError("BUY_FEE_BPS must be between 0 and 10000");
    }

    if (create_compute_units < 1 || sell_compute_units < 1) {
        throw ValidationError("CREATE_COMPUTE_UNITS and SELL_COMPUTE_UNITS must be positive");
    }

    if (confirm_timeout_seconds < 1) {
        throw ValidationError("CONFIRM_TIMEOUT_SECONDS must be at least 1");
    }

    if (account_visible_attempts < 1 || account_visible_delay_ms < 0) {
        throw ValidationError("ACCOUNT_VISIBLE_ATTEMPTS must be positive and ACCOUNT_VISIBLE_DELAY_MS non-negative");
    }

    if (queue_file.empty()) {
        throw ValidationError("QUEUE_FILE cannot be empty");
    }

    if (db_path.empty()) {
        throw ValidationError("DB_PATH cannot be empty");
    }

    if (health_port <= 0 || health_port > 65535) {
        throw ValidationError("HEALTH_PORT must be between 1 and 65535");
    }

    spdlog::info("Configuration validated successfully");
}
