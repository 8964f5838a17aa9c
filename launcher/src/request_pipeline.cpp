#include "request_pipeline.hpp"
#include "curve_math.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

RequestPipeline::RequestPipeline(const ProtocolConstants& constants, const TransactionBuilder& builder,
                                 TransactionSubmitter& submitter, SolanaRpc& rpc, Clock& clock, const Keypair& payer,
                                 RequestSource& source, OutcomeSink& sink, PipelineSettings settings)
    : constants_(constants),
      builder_(builder),
      submitter_(submitter),
      rpc_(rpc),
      clock_(clock),
      payer_(payer),
      source_(source),
      sink_(sink),
      settings_(std::move(settings)) {
}

Outcome RequestPipeline::run(const std::string& request_id) {
    Outcome outcome;
    outcome.request_id = request_id;

    try {
        auto request = source_.resolve(request_id);
        spdlog::info("Launching {} ({}) for request {}", request.name, request.symbol, request_id);

        auto launched = launch(request);
        outcome.success = true;
        outcome.status = OutcomeStatus::Launched;
        outcome.token_address = launched.addresses.mint.to_base58();
        outcome.deploy_signature = launched.signature;
        outcome.sol_spent = launched.sol_spent;

        if (util::sol_to_lamports(request.initial_buy_sol) == 0) {
            // No buy, so no token account and nothing to sell
            spdlog::info("No initial buy for {}, skipping sell", outcome.token_address);
        } else {
            sell_after_cooldown(request, launched, outcome);
        }

        outcome.profit_loss = static_cast<int64_t>(outcome.sol_received) - static_cast<int64_t>(outcome.sol_spent);
        spdlog::info("Request {} summary: spent {:.6f} SOL, received {:.6f} SOL, P/L {:+.6f} SOL", request_id,
                     util::lamports_to_sol(static_cast<int64_t>(outcome.sol_spent)),
                     util::lamports_to_sol(static_cast<int64_t>(outcome.sol_received)),
                     util::lamports_to_sol(outcome.profit_loss));
    } catch (const DerivationError& e) {
        spdlog::critical("Address derivation integrity failure for {}: {}", request_id, e.what());
        outcome = Outcome::failure(request_id, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Request {} failed: {}", request_id, e.what());
        outcome = Outcome::failure(request_id, e.what());
    }

    outcome.timestamp = util::format_iso8601(clock_.now());

    try {
        sink_.record(outcome);
    } catch (const std::exception& e) {
        spdlog::error("Could not record outcome of {}: {}", request_id, e.what());
    }
    return outcome;
}

void RequestPipeline::sell_after_cooldown(const LaunchRequest& request, const LaunchResult& launched,
                                          Outcome& outcome) {
    // A failed sell leaves a successful launch behind; keep the record
    try {
        spdlog::info("Waiting {}s before selling {}", settings_.sell_delay.count(), outcome.token_address);
        clock_.sleep_for(settings_.sell_delay);

        auto sold = sell_position(launched.addresses.mint, util::sol_to_lamports(request.priority_fee_sol));
        outcome.status = OutcomeStatus::Sold;
        outcome.sell_signature = sold.signature;
        outcome.sol_received = sold.sol_received;
    } catch (const std::exception& e) {
        spdlog::warn("Sell of {} failed after successful launch: {}", outcome.token_address, e.what());
        outcome.error = std::string("sell failed: ") + e.what();
    }
}

LaunchResult RequestPipeline::launch(const LaunchRequest& request) {
    auto mint = Keypair::generate();
    return launch(request, mint);
}

LaunchResult RequestPipeline::launch(const LaunchRequest& request, const Keypair& mint) {
    request.validate();

    LaunchResult result;
    result.addresses = pda::derive_launch_addresses(mint.public_key(), payer_.public_key(), constants_);
    spdlog::info("Mint {} bonding curve {}", result.addresses.mint.to_base58(),
                 result.addresses.bonding_curve.address.to_base58());

    auto plan = builder_.build_create_and_buy(request, result.addresses);
    result.signature = submitter_.submit(plan, {&payer_, &mint});
    spdlog::info("Token {} created: {}", result.addresses.mint.to_base58(), result.signature);

    try {
        int64_t delta = submitter_.compute_settlement_delta(result.signature, payer_.public_key(),
                                                            settings_.visibility);
        result.sol_spent = delta < 0 ? static_cast<uint64_t>(-delta) : 0;
    } catch (const std::exception& e) {
        // Confirmed but unreadable: charge the most the transaction could have cost
        uint64_t fee = util::sol_to_lamports(request.priority_fee_sol);
        uint64_t buy = util::sol_to_lamports(request.initial_buy_sol);
        result.sol_spent = buy > 0 ? builder_.quote_initial_buy(buy, request.slippage_pct).max_sol_cost + fee : fee;
        spdlog::warn("Settlement of {} unavailable ({}), charging estimated {} lamports", result.signature,
                     e.what(), result.sol_spent);
    }
    return result;
}

SellResult RequestPipeline::sell_position(const PublicKey& mint, uint64_t priority_fee_lamports) {
    auto addresses = pda::derive_launch_addresses(mint, payer_.public_key(), constants_);
    const auto& token_account = addresses.user_token_account.address;

    submitter_.await_account_visible(token_account, settings_.visibility);

    SellResult result;
    // Whatever is held now, not what the buy was quoted for
    result.tokens_sold = rpc_.get_token_account_balance(token_account);
    spdlog::info("Selling {} base units of {}", result.tokens_sold, mint.to_base58());

    if (settings_.sell_min_out_guard) {
        result.min_sol_output = guarded_min_output(addresses, result.tokens_sold);
    }

    SellOrder order;
    order.priority_fee_lamports = priority_fee_lamports;
    order.min_sol_output = result.min_sol_output;
    auto plan = builder_.build_sell(order, addresses, result.tokens_sold);
    result.signature = submitter_.submit(plan, {&payer_});
    spdlog::info("Token {} sold: {}", mint.to_base58(), result.signature);

    int64_t delta = submitter_.compute_settlement_delta(result.signature, payer_.public_key(), settings_.visibility);
    result.sol_received = delta > 0 ? static_cast<uint64_t>(delta) : 0;
    return result;
}

uint64_t RequestPipeline::guarded_min_output(const LaunchAddresses& addresses, uint64_t balance) {
    auto account = rpc_.get_account_info(addresses.bonding_curve.address);
    if (!account) {
        throw NetworkError("Bonding curve " + addresses.bonding_curve.address.to_base58() + " not found");
    }
    auto curve_state = BondingCurveState::decode(account->data);
    if (curve_state.complete) {
        throw ProgramRejection("Bonding curve for " + addresses.mint.to_base58() + " is complete");
    }

    uint64_t expected = curve::quote_sell(balance, curve_state.virtual_token_reserves,
                                          curve_state.virtual_sol_reserves, settings_.quote_fee_bps);
    uint64_t min_out = curve::min_sol_output(expected, settings_.sell_slippage_pct);
    spdlog::info("Sell guard: expecting {} lamports, accepting no less than {}", expected, min_out);
    return min_out;
}
