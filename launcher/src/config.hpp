#pragma once
#include <string>

class Config {
public:
    // Service info
    std::string service_name = "launcher";
    std::string log_level = "info";

    // Solana
    std::string solana_rpc_url = "https://api.mainnet-beta.solana.com";
    std::string private_key;  // base58 or base64 64-byte secret

    // Queue gates
    int hourly_launch_limit = 10;
    double daily_budget_sol = 1.0;
    int launch_delay_seconds = 120;
    int gate_max_sleep_seconds = 300;

    // Launch defaults
    double default_initial_buy_sol = 0.01;
    double default_slippage_pct = 10.0;
    double default_priority_fee_sol = 0.0001;

    // Sell
    int sell_delay_seconds = 15;
    double sell_slippage_pct = 5.0;
    bool sell_min_out_guard = false;

    // Transaction shaping
    int buy_fee_bps = 0;
    int create_compute_units = 300000;
    int sell_compute_units = 100000;

    // Confirmation and visibility
    int confirm_timeout_seconds = 60;
    int account_visible_attempts = 5;
    int account_visible_delay_ms = 2000;

    // Storage
    std::string queue_file = "queue.json";
    std::string db_path = "launcher.db";

    // Control + health server
    std::string health_host = "0.0.0.0";
    int health_port = 10000;

    static Config from_env();
    // Throws ValidationError naming the offending variable
    void validate() const;
};
