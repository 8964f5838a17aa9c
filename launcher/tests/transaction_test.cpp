#include "transaction.hpp"
#include "errors.hpp"
#include "fakes.hpp"
#include "instruction_encoder.hpp"
#include "util.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace {

const ProtocolConstants& c = ProtocolConstants::mainnet();

class MessageCompileTest : public ::testing::Test {
protected:
    PublicKey payer = counting_key(10);
    PublicKey other_signer = counting_key(20);
    PublicKey writable_a = counting_key(30);
    PublicKey readonly_b = counting_key(40);
    PublicKey program = counting_key(50);
    Blockhash blockhash = counting_key(60);
};

} // namespace

TEST_F(MessageCompileTest, OrdersKeysByPrivilegeWithPayerFirst) {
    Instruction ix{program,
                   {AccountMeta::readonly(readonly_b), AccountMeta::writable(writable_a),
                    AccountMeta::readonly(other_signer, true), AccountMeta::writable(payer, true)},
                   {9}};
    auto message = Message::compile({ix}, payer, blockhash);

    std::vector<PublicKey> expected = {payer, other_signer, writable_a, readonly_b, program};
    EXPECT_EQ(message.account_keys, expected);
    EXPECT_EQ(message.header.num_required_signatures, 2);
    EXPECT_EQ(message.header.num_readonly_signed, 1);
    EXPECT_EQ(message.header.num_readonly_unsigned, 2);

    ASSERT_EQ(message.instructions.size(), 1u);
    EXPECT_EQ(message.instructions[0].program_id_index, 4);
    EXPECT_EQ(message.instructions[0].account_indices, (std::vector<uint8_t>{3, 2, 1, 0}));
}

TEST_F(MessageCompileTest, MergesFlagsAcrossInstructions) {
    Instruction first{program, {AccountMeta::readonly(writable_a)}, {}};
    Instruction second{program, {AccountMeta::writable(writable_a)}, {}};
    auto message = Message::compile({first, second}, payer, blockhash);

    ASSERT_EQ(message.account_keys.size(), 3u);
    EXPECT_EQ(message.account_keys[1], writable_a);
    EXPECT_TRUE(message.is_writable(1));
    EXPECT_FALSE(message.is_writable(2));
    EXPECT_TRUE(message.is_writable(0));
}

TEST_F(MessageCompileTest, SignerKeysAreTheLeadingBlock) {
    Instruction ix{program, {AccountMeta::writable(other_signer, true)}, {}};
    auto message = Message::compile({ix}, payer, blockhash);
    EXPECT_EQ(message.signer_keys(), (std::vector<PublicKey>{payer, other_signer}));
}

TEST_F(MessageCompileTest, SerializedLayout) {
    Instruction ix{program, {AccountMeta::writable(writable_a)}, {0xaa, 0xbb}};
    auto message = Message::compile({ix}, payer, blockhash);
    auto bytes = message.serialize();

    // header(3) + keys(1 + 3*32) + blockhash(32) + ixs(1 + 1 + 1 + 1 + 1 + 2)
    ASSERT_EQ(bytes.size(), 3u + 1 + 96 + 32 + 7);
    EXPECT_EQ(bytes[0], 1);
    EXPECT_EQ(bytes[1], 0);
    EXPECT_EQ(bytes[2], 1);
    EXPECT_EQ(bytes[3], 3);
    EXPECT_EQ(util::to_hex({bytes.end() - 7, bytes.end()}), "01020101" "02aabb");
}

TEST_F(MessageCompileTest, TooManyAccountsIsRejected) {
    Instruction ix{program, {}, {}};
    for (int i = 0; i < 300; ++i) {
        PublicKey key;
        key.bytes[0] = static_cast<uint8_t>(i);
        key.bytes[1] = static_cast<uint8_t>(i >> 8);
        key.bytes[2] = 0xee;
        ix.accounts.push_back(AccountMeta::readonly(key));
    }
    EXPECT_THROW(Message::compile({ix}, payer, blockhash), FieldTooLarge);
}

TEST(SignedTransactionTest, IdIsBase58OfFirstSignature) {
    auto kp = Keypair::from_seed(counting_bytes(0, 32));
    Instruction ix{counting_key(50), {}, {1}};
    SignedTransaction tx;
    tx.message = Message::compile({ix}, kp.public_key(), counting_key(60));
    tx.signatures.push_back(kp.sign(tx.message.serialize()));

    auto& sig = tx.signatures.front();
    EXPECT_EQ(tx.id(), util::base58_encode({sig.begin(), sig.end()}));

    auto wire = tx.serialize();
    EXPECT_EQ(wire[0], 1);
    EXPECT_EQ(util::base64_decode(tx.to_base64()), wire);
}

TEST(SignedTransactionTest, UnsignedHasNoId) {
    SignedTransaction tx;
    EXPECT_THROW(tx.id(), EncodingError);
}

TEST(SignedTransactionTest, OversizedTransactionIsRejected) {
    auto kp = Keypair::from_seed(counting_bytes(0, 32));
    Instruction ix{counting_key(50), {}, std::vector<uint8_t>(1200, 7)};
    SignedTransaction tx;
    tx.message = Message::compile({ix}, kp.public_key(), counting_key(60));
    tx.signatures.push_back(kp.sign(tx.message.serialize()));
    EXPECT_THROW(tx.serialize(), FieldTooLarge);
}

TEST(ComputeBudgetTest, InstructionData) {
    auto limit = compute_budget::set_compute_unit_limit(300000, c);
    EXPECT_EQ(limit.program_id, c.compute_budget_program);
    EXPECT_TRUE(limit.accounts.empty());
    EXPECT_EQ(util::to_hex(limit.data), "02e0930400");

    auto price = compute_budget::set_compute_unit_price(333333, c);
    EXPECT_EQ(util::to_hex(price.data), "031516050000000000");
}

TEST(ComputeBudgetTest, PriceSpreadsFeeOverUnits) {
    // 0.0001 SOL over 300k units
    EXPECT_EQ(compute_budget::unit_price_for_fee(100000, 300000), 333333u);
    EXPECT_EQ(compute_budget::unit_price_for_fee(100000, 100000), 1000000u);
    EXPECT_EQ(compute_budget::unit_price_for_fee(0, 100000), 0u);
    EXPECT_THROW(compute_budget::unit_price_for_fee(1, 0), ValidationError);
}

TEST(ComputeBudgetTest, HugePriorityFeeIsRejected) {
    const uint64_t largest = std::numeric_limits<uint64_t>::max() / 1000000;
    EXPECT_EQ(compute_budget::unit_price_for_fee(largest, 1000000), largest);
    EXPECT_THROW(compute_budget::unit_price_for_fee(largest + 1, 1000000), FieldTooLarge);
}

TEST(AssociatedTokenAccountTest, IdempotentCreateLayout) {
    auto payer = counting_key(1);
    auto ata = counting_key(2);
    auto mint = counting_key(3);
    auto ix = create_associated_token_account_idempotent(payer, ata, payer, mint, c);

    EXPECT_EQ(ix.program_id, c.associated_token_program);
    EXPECT_EQ(ix.data, std::vector<uint8_t>{1});
    ASSERT_EQ(ix.accounts.size(), 6u);
    EXPECT_EQ(ix.accounts[0], AccountMeta::writable(payer, true));
    EXPECT_EQ(ix.accounts[1], AccountMeta::writable(ata));
    EXPECT_EQ(ix.accounts[2], AccountMeta::readonly(payer));
    EXPECT_EQ(ix.accounts[3], AccountMeta::readonly(mint));
    EXPECT_EQ(ix.accounts[4], AccountMeta::readonly(c.system_program));
    EXPECT_EQ(ix.accounts[5], AccountMeta::readonly(c.token_program));
}
