#pragma once
#include "clock.hpp"
#include "constants.hpp"
#include "launch_queue.hpp"
#include "pda.hpp"
#include "pubkey.hpp"
#include "retry_policy.hpp"
#include "solana_client.hpp"
#include "transaction_builder.hpp"
#include "transaction_submitter.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <string>

// Supplies the resolved (name, symbol, metadata URL) for a request id
class RequestSource {
public:
    virtual ~RequestSource() = default;
    // Throws ValidationError for an unknown id
    virtual LaunchRequest resolve(const std::string& request_id) = 0;
};

// Receives the final record of each request
class OutcomeSink {
public:
    virtual ~OutcomeSink() = default;
    virtual void record(const Outcome& outcome) = 0;
};

struct PipelineSettings {
    std::chrono::seconds sell_delay{15};
    bool sell_min_out_guard = false;
    double sell_slippage_pct = 5.0;
    uint64_t quote_fee_bps = 0;
    RetryPolicy visibility = RetryPolicy::fixed(5, std::chrono::milliseconds(2000));
};

struct LaunchResult {
    std::string signature;
    LaunchAddresses addresses;
    uint64_t sol_spent = 0;
};

struct SellResult {
    std::string signature;
    uint64_t tokens_sold = 0;
    uint64_t min_sol_output = 0;
    uint64_t sol_received = 0;
};

// create+buy, cool-down, sell, record. One request at a time.
class RequestPipeline : public LaunchRunner {
public:
    RequestPipeline(const ProtocolConstants& constants, const TransactionBuilder& builder,
                    TransactionSubmitter& submitter, SolanaRpc& rpc, Clock& clock, const Keypair& payer,
                    RequestSource& source, OutcomeSink& sink, PipelineSettings settings);

    // Never throws; failures come back as an unsuccessful Outcome
    Outcome run(const std::string& request_id) override;

    // create+buy with a freshly generated mint
    LaunchResult launch(const LaunchRequest& request);
    LaunchResult launch(const LaunchRequest& request, const Keypair& mint);

    // Sells the whole live balance of the payer's token account for mint
    SellResult sell_position(const PublicKey& mint, uint64_t priority_fee_lamports);

private:
    void sell_after_cooldown(const LaunchRequest& request, const LaunchResult& launched, Outcome& outcome);
    uint64_t guarded_min_output(const LaunchAddresses& addresses, uint64_t balance);

    const ProtocolConstants& constants_;
    const TransactionBuilder& builder_;
    TransactionSubmitter& submitter_;
    SolanaRpc& rpc_;
    Clock& clock_;
    const Keypair& payer_;
    RequestSource& source_;
    OutcomeSink& sink_;
    PipelineSettings settings_;
};
