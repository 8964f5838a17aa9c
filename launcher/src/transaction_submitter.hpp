#pragma once
#include "clock.hpp"
#include "pubkey.hpp"
#include "retry_policy.hpp"
#include "solana_client.hpp"
#include "transaction.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Signs, broadcasts and confirms transaction plans against one RPC node.
class TransactionSubmitter {
public:
    TransactionSubmitter(SolanaRpc& rpc, Clock& clock, std::chrono::seconds confirm_timeout,
                         std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));

    // Compiles the plan against a fresh blockhash and signs it. Every key the
    // message requires must be among the signers.
    SignedTransaction sign(const TransactionPlan& plan, const std::vector<const Keypair*>& signers);

    // sign + broadcast + wait for confirmation; returns the signature.
    // Throws ConfirmationTimeout when no verdict arrives in time.
    std::string submit(const TransactionPlan& plan, const std::vector<const Keypair*>& signers);

    // Rebroadcasts identical signed bytes. A transaction that already landed
    // is deduplicated by the cluster on its signature.
    std::string resubmit(const SignedTransaction& tx);

    void await_confirmation(const std::string& signature);

    // Polls until the account is queryable; AccountNotVisible when attempts run out
    void await_account_visible(const PublicKey& address, const RetryPolicy& policy);

    // post - pre lamports of owner in a confirmed transaction. Includes fees paid.
    int64_t compute_settlement_delta(const std::string& signature, const PublicKey& owner,
                                     const RetryPolicy& policy);

private:
    SolanaRpc& rpc_;
    Clock& clock_;
    std::chrono::seconds confirm_timeout_;
    std::chrono::milliseconds poll_interval_;
};
