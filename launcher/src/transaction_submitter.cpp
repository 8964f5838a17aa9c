#include "transaction_submitter.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

TransactionSubmitter::TransactionSubmitter(SolanaRpc& rpc, Clock& clock, std::chrono::seconds confirm_timeout,
                                           std::chrono::milliseconds poll_interval)
    : rpc_(rpc), clock_(clock), confirm_timeout_(confirm_timeout), poll_interval_(poll_interval) {
}

SignedTransaction TransactionSubmitter::sign(const TransactionPlan& plan,
                                             const std::vector<const Keypair*>& signers) {
    for (const auto& required : plan.required_signers()) {
        bool present = std::any_of(signers.begin(), signers.end(), [&](const Keypair* kp) {
            return kp && kp->public_key() == required;
        });
        if (!present) {
            throw ValidationError("Missing signer " + required.to_base58() + " for " + plan.label());
        }
    }

    auto blockhash = rpc_.get_latest_blockhash();

    SignedTransaction tx;
    tx.message = Message::compile(plan.instructions(), plan.payer(), blockhash);
    auto message_bytes = tx.message.serialize();

    for (const auto& key : tx.message.signer_keys()) {
        auto it = std::find_if(signers.begin(), signers.end(), [&](const Keypair* kp) {
            return kp && kp->public_key() == key;
        });
        if (it == signers.end()) {
            throw ValidationError("No keypair for required signer " + key.to_base58());
        }
        tx.signatures.push_back((*it)->sign(message_bytes));
    }

    spdlog::debug("Signed {} ({} instructions, {} accounts, {} signatures)", plan.label(),
                  plan.instructions().size(), tx.message.account_keys.size(), tx.signatures.size());
    return tx;
}

std::string TransactionSubmitter::submit(const TransactionPlan& plan, const std::vector<const Keypair*>& signers) {
    auto tx = sign(plan, signers);
    spdlog::info("Submitting {} transaction {}", plan.label(), tx.id());
    return resubmit(tx);
}

std::string TransactionSubmitter::resubmit(const SignedTransaction& tx) {
    auto signature = tx.id();
    auto reported = rpc_.send_transaction(tx.to_base64());
    if (reported != signature) {
        spdlog::warn("Node reported signature {} for transaction {}", reported, signature);
    }

    await_confirmation(signature);
    return signature;
}

void TransactionSubmitter::await_confirmation(const std::string& signature) {
    auto deadline = clock_.now() + confirm_timeout_;

    while (true) {
        auto status = rpc_.get_signature_status(signature);
        if (status) {
            if (status->err) {
                throw ProgramRejection("Transaction " + signature + " failed: " + *status->err);
            }
            if (status->is_confirmed()) {
                spdlog::info("Transaction {} {}", signature, status->confirmation_status);
                return;
            }
        }

        if (clock_.now() >= deadline) {
            throw ConfirmationTimeout("Transaction " + signature + " not confirmed within " +
                                      std::to_string(confirm_timeout_.count()) + "s");
        }
        clock_.sleep_for(poll_interval_);
    }
}

void TransactionSubmitter::await_account_visible(const PublicKey& address, const RetryPolicy& policy) {
    for (int attempt = 1; attempt <= policy.max_attempts(); ++attempt) {
        try {
            if (rpc_.get_account_info(address)) {
                spdlog::debug("Account {} visible after {} attempt(s)", address.to_base58(), attempt);
                return;
            }
            spdlog::debug("Account {} not visible yet (attempt {}/{})", address.to_base58(), attempt,
                          policy.max_attempts());
        } catch (const NetworkError& e) {
            spdlog::warn("Visibility check for {} failed (attempt {}/{}): {}", address.to_base58(), attempt,
                         policy.max_attempts(), e.what());
        }

        if (attempt < policy.max_attempts()) {
            clock_.sleep_for(policy.delay_after(attempt));
        }
    }

    throw AccountNotVisible("Account " + address.to_base58() + " not visible after " +
                            std::to_string(policy.max_attempts()) + " attempts");
}

int64_t TransactionSubmitter::compute_settlement_delta(const std::string& signature, const PublicKey& owner,
                                                       const RetryPolicy& policy) {
    std::optional<TransactionMeta> meta;
    for (int attempt = 1; attempt <= policy.max_attempts() && !meta; ++attempt) {
        meta = rpc_.get_transaction(signature);
        if (!meta && attempt < policy.max_attempts()) {
            clock_.sleep_for(policy.delay_after(attempt));
        }
    }
    if (!meta) {
        throw NetworkError("Transaction " + signature + " not found");
    }

    auto it = std::find(meta->account_keys.begin(), meta->account_keys.end(), owner);
    if (it == meta->account_keys.end()) {
        throw DecodeError("Account " + owner.to_base58() + " not in transaction " + signature);
    }
    auto index = static_cast<size_t>(it - meta->account_keys.begin());
    if (index >= meta->pre_balances.size() || index >= meta->post_balances.size()) {
        throw DecodeError("Balance lists of " + signature + " are shorter than its account keys");
    }

    int64_t delta = static_cast<int64_t>(meta->post_balances[index]) - static_cast<int64_t>(meta->pre_balances[index]);
    spdlog::debug("Settlement delta for {} in {}: {} lamports", owner.to_base58(), signature, delta);
    return delta;
}
