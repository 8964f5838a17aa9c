#include "service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace {

constexpr std::chrono::minutes STATUS_LOG_INTERVAL{5};

PipelineSettings pipeline_settings(const Config& config) {
    PipelineSettings settings;
    settings.sell_delay = std::chrono::seconds(config.sell_delay_seconds);
    settings.sell_min_out_guard = config.sell_min_out_guard;
    settings.sell_slippage_pct = config.sell_slippage_pct;
    settings.quote_fee_bps = static_cast<uint64_t>(config.buy_fee_bps);
    settings.visibility = RetryPolicy::fixed(config.account_visible_attempts,
                                             std::chrono::milliseconds(config.account_visible_delay_ms));
    return settings;
}

ComputeUnits compute_units(const Config& config) {
    ComputeUnits units;
    units.create = static_cast<uint32_t>(config.create_compute_units);
    units.sell = static_cast<uint32_t>(config.sell_compute_units);
    return units;
}

} // namespace

Service::Service(const Config& config)
    : config_(config),
      rpc_(config),
      payer_(Keypair::from_encoded(config.private_key)),
      constants_(ProtocolConstants::mainnet()),
      builder_(constants_, compute_units(config), static_cast<uint64_t>(config.buy_fee_bps)),
      submitter_(rpc_, clock_, std::chrono::seconds(config.confirm_timeout_seconds)),
      db_(config.db_path),
      pipeline_(constants_, builder_, submitter_, rpc_, clock_, payer_, db_, db_, pipeline_settings(config)),
      store_(config.queue_file) {
    spdlog::info("Wallet {} on {} (constants {})", payer_.public_key().to_base58(), config_.solana_rpc_url,
                 constants_.version);

    try {
        uint64_t balance = rpc_.get_balance(payer_.public_key());
        spdlog::info("Wallet balance: {:.6f} SOL", util::lamports_to_sol(static_cast<int64_t>(balance)));
    } catch (const std::exception& e) {
        spdlog::warn("Could not read wallet balance: {}", e.what());
    }
}

Service::~Service() = default;

void Service::run() {
    QueueLimits limits;
    limits.hourly_limit = config_.hourly_launch_limit;
    limits.daily_budget_lamports = util::sol_to_lamports(config_.daily_budget_sol);
    limits.launch_delay = std::chrono::seconds(config_.launch_delay_seconds);
    limits.gate_max_sleep = std::chrono::seconds(config_.gate_max_sleep_seconds);

    queue_ = std::make_unique<LaunchQueue>(limits, store_, pipeline_, clock_);
    server_ = std::make_unique<ControlServer>(config_.service_name, *queue_, db_, rpc_, launch_defaults());
    server_->start(config_.health_host, config_.health_port);

    running_ = true;
    spdlog::info("{} serving. Hourly limit {}, daily budget {:.4f} SOL, launch delay {}s", config_.service_name,
                 limits.hourly_limit, config_.daily_budget_sol, config_.launch_delay_seconds);

    auto next_status_log = std::chrono::steady_clock::now() + STATUS_LOG_INTERVAL;
    while (running_) {
        if (std::chrono::steady_clock::now() >= next_status_log) {
            log_status();
            next_status_log = std::chrono::steady_clock::now() + STATUS_LOG_INTERVAL;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Stopping {}...", config_.service_name);
    server_->stop();
    // Lets an in-flight request finish; pending ids stay in the queue file
    queue_->stop();
    log_status();
    server_.reset();
    queue_.reset();
    spdlog::info("{} run loop finished.", config_.service_name);
}

void Service::stop() {
    running_ = false;
}

LaunchResult Service::launch_once(const LaunchRequest& request) {
    auto result = pipeline_.launch(request);
    spdlog::info("Launched {} in {} (spent {:.6f} SOL)", result.addresses.mint.to_base58(), result.signature,
                 util::lamports_to_sol(static_cast<int64_t>(result.sol_spent)));
    return result;
}

SellResult Service::sell_once(const PublicKey& mint) {
    auto result = pipeline_.sell_position(mint, util::sol_to_lamports(config_.default_priority_fee_sol));
    spdlog::info("Sold {} base units of {} in {} (received {:.6f} SOL)", result.tokens_sold, mint.to_base58(),
                 result.signature, util::lamports_to_sol(static_cast<int64_t>(result.sol_received)));
    return result;
}

LaunchDefaults Service::launch_defaults() const {
    LaunchDefaults defaults;
    defaults.initial_buy_sol = config_.default_initial_buy_sol;
    defaults.slippage_pct = config_.default_slippage_pct;
    defaults.priority_fee_sol = config_.default_priority_fee_sol;
    return defaults;
}

void Service::log_status() {
    if (!queue_) {
        return;
    }
    auto status = queue_->status();
    spdlog::info("Queue status: {} pending, {}, hour {}/{}, budget {:.4f}/{:.4f} SOL, processed {} ({} failed, "
                 "{:.1f}% success){}",
                 status.queue_size, to_string(queue_->mode()), status.launches_this_hour, status.hourly_limit,
                 status.budget_used_sol, status.daily_budget_sol, status.total_processed, status.total_failed,
                 status.success_rate(), status.persistence_healthy ? "" : ", persistence FAILING");
}
