#include "transaction_submitter.hpp"
#include "errors.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace {

SignatureStatus status_of(const std::string& level, std::optional<std::string> err = std::nullopt) {
    SignatureStatus status;
    status.confirmation_status = level;
    status.err = std::move(err);
    return status;
}

class TransactionSubmitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        rpc.settlement_owner = payer.public_key();
    }

    TransactionPlan transfer_plan() {
        Instruction ix{counting_key(50), {AccountMeta::writable(counting_key(30))}, {1, 2, 3}};
        return TransactionPlan("test", payer.public_key(), {ix}, {payer.public_key()});
    }

    FakeRpc rpc;
    FakeClock clock;
    TransactionSubmitter submitter{rpc, clock, 10s, 1000ms};
    Keypair payer = Keypair::from_seed(counting_bytes(0, 32));
    RetryPolicy policy = RetryPolicy::fixed(3, 2000ms);
};

} // namespace

TEST_F(TransactionSubmitterTest, SignUsesFreshBlockhashAndEverySigner) {
    auto mint = Keypair::from_seed(counting_bytes(1, 32));
    Instruction ix{counting_key(50), {AccountMeta::writable(mint.public_key(), true)}, {}};
    TransactionPlan plan("two", payer.public_key(), {ix}, {payer.public_key(), mint.public_key()});

    auto tx = submitter.sign(plan, {&mint, &payer});

    EXPECT_EQ(rpc.blockhash_calls, 1);
    EXPECT_EQ(tx.message.recent_blockhash, rpc.blockhash);
    ASSERT_EQ(tx.signatures.size(), 2u);
    auto bytes = tx.message.serialize();
    // Signature order follows the message's key order, payer first
    EXPECT_EQ(tx.signatures[0], payer.sign(bytes));
    EXPECT_EQ(tx.signatures[1], mint.sign(bytes));
}

TEST_F(TransactionSubmitterTest, MissingSignerIsRejectedBeforeAnyNetworkCall) {
    auto mint = Keypair::from_seed(counting_bytes(1, 32));
    TransactionPlan plan("two", payer.public_key(), transfer_plan().instructions(),
                         {payer.public_key(), mint.public_key()});

    EXPECT_THROW(submitter.sign(plan, {&payer}), ValidationError);
    EXPECT_EQ(rpc.blockhash_calls, 0);
}

TEST_F(TransactionSubmitterTest, SubmitReturnsPayerSignature) {
    auto signature = submitter.submit(transfer_plan(), {&payer});

    ASSERT_EQ(rpc.sent.size(), 1u);
    auto raw = util::base64_decode(rpc.sent[0]);
    EXPECT_EQ(signature, util::base58_encode({raw.begin() + 1, raw.begin() + 65}));
}

TEST_F(TransactionSubmitterTest, WaitsThroughProcessedUntilConfirmed) {
    rpc.scripted_statuses = {std::nullopt, status_of("processed"), status_of("finalized")};
    submitter.submit(transfer_plan(), {&payer});
    EXPECT_EQ(clock.sleeps(), (std::vector<std::chrono::milliseconds>{1000ms, 1000ms}));
}

TEST_F(TransactionSubmitterTest, ExecutionErrorIsAProgramRejection) {
    rpc.scripted_statuses = {status_of("confirmed", std::string("{\"InstructionError\":[2,{\"Custom\":6002}]}"))};
    EXPECT_THROW(submitter.submit(transfer_plan(), {&payer}), ProgramRejection);
}

TEST_F(TransactionSubmitterTest, PreflightRejectionPropagates) {
    rpc.send_rejected = true;
    EXPECT_THROW(submitter.submit(transfer_plan(), {&payer}), ProgramRejection);
}

TEST_F(TransactionSubmitterTest, NoVerdictTimesOut) {
    rpc.confirm_by_default = false;
    EXPECT_THROW(submitter.submit(transfer_plan(), {&payer}), ConfirmationTimeout);
    EXPECT_GE(clock.total_slept(), 10000ms);
    EXPECT_LE(clock.total_slept(), 11000ms);
}

TEST_F(TransactionSubmitterTest, TimeoutIsANetworkError) {
    rpc.confirm_by_default = false;
    EXPECT_THROW(submitter.submit(transfer_plan(), {&payer}), NetworkError);
}

TEST_F(TransactionSubmitterTest, ResubmitSendsIdenticalBytes) {
    auto tx = submitter.sign(transfer_plan(), {&payer});
    auto first = submitter.resubmit(tx);
    auto second = submitter.resubmit(tx);

    EXPECT_EQ(first, second);
    ASSERT_EQ(rpc.sent.size(), 2u);
    EXPECT_EQ(rpc.sent[0], rpc.sent[1]);
    EXPECT_EQ(rpc.blockhash_calls, 1);
}

TEST_F(TransactionSubmitterTest, AccountVisibleAfterRetries) {
    auto address = counting_key(70);
    rpc.add_account(address);
    rpc.invisible_polls = 2;

    submitter.await_account_visible(address, policy);
    EXPECT_EQ(rpc.account_info_calls, 3);
    EXPECT_EQ(clock.total_slept(), 4000ms);
}

TEST_F(TransactionSubmitterTest, AccountNeverVisible) {
    EXPECT_THROW(submitter.await_account_visible(counting_key(70), policy), AccountNotVisible);
    EXPECT_EQ(rpc.account_info_calls, 3);
    // No sleep after the last attempt
    EXPECT_EQ(clock.total_slept(), 4000ms);
}

TEST_F(TransactionSubmitterTest, NetworkFailuresCountAsAttempts) {
    rpc.fail_account_lookups = true;
    EXPECT_THROW(submitter.await_account_visible(counting_key(70), policy), AccountNotVisible);
    EXPECT_EQ(rpc.account_info_calls, 3);
}

TEST_F(TransactionSubmitterTest, SettlementDeltaForOwner) {
    rpc.settlement_deltas = {-10105000};
    EXPECT_EQ(submitter.compute_settlement_delta("sig", payer.public_key(), policy), -10105000);
}

TEST_F(TransactionSubmitterTest, UnindexedTransactionIsANetworkError) {
    EXPECT_THROW(submitter.compute_settlement_delta("sig", payer.public_key(), policy), NetworkError);
    EXPECT_EQ(rpc.transaction_calls, 3);
    EXPECT_EQ(clock.total_slept(), 4000ms);
}

TEST_F(TransactionSubmitterTest, SettlementWithoutOwnerIsADecodeError) {
    rpc.settlement_deltas = {5};
    EXPECT_THROW(submitter.compute_settlement_delta("sig", counting_key(99), policy), DecodeError);
}
