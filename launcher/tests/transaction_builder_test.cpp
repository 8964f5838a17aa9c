#include "transaction_builder.hpp"
#include "errors.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

namespace {

const ProtocolConstants& c = ProtocolConstants::mainnet();

class TransactionBuilderTest : public ::testing::Test {
protected:
    TransactionBuilder builder{c, ComputeUnits{}};
    LaunchAddresses addresses = pda::derive_launch_addresses(counting_key(1), counting_key(101), c);
};

} // namespace

TEST_F(TransactionBuilderTest, CreateAndBuyWithPriorityFee) {
    auto plan = builder.build_create_and_buy(sample_request(), addresses);

    EXPECT_EQ(plan.label(), "create_and_buy");
    EXPECT_EQ(plan.payer(), addresses.owner);
    EXPECT_EQ(plan.required_signers(), (std::vector<PublicKey>{addresses.owner, addresses.mint}));

    const auto& ixs = plan.instructions();
    ASSERT_EQ(ixs.size(), 5u);
    EXPECT_EQ(ixs[0].program_id, c.compute_budget_program);
    EXPECT_EQ(ixs[0].data[0], 2);
    EXPECT_EQ(ixs[1].program_id, c.compute_budget_program);
    EXPECT_EQ(ixs[1].data[0], 3);
    EXPECT_EQ(instruction_encoder::kind_of(ixs[2].data, c), InstructionKind::Create);
    EXPECT_EQ(ixs[3].program_id, c.associated_token_program);
    EXPECT_EQ(instruction_encoder::kind_of(ixs[4].data, c), InstructionKind::Buy);
}

TEST_F(TransactionBuilderTest, DefaultBuyIsQuotedAgainstFreshCurve) {
    auto plan = builder.build_create_and_buy(sample_request(), addresses);
    auto args = instruction_encoder::decode_buy(plan.instructions().back().data, c);
    EXPECT_EQ(args.amount, 357547484171ULL);
    EXPECT_EQ(args.max_sol_cost, 11000000u);
}

TEST_F(TransactionBuilderTest, CreateCarriesRequestFieldsAndOwnerAsCreator) {
    auto plan = builder.build_create_and_buy(sample_request(), addresses);
    auto args = instruction_encoder::decode_create(plan.instructions()[2].data, c);
    EXPECT_EQ(args.name, "Test Coin");
    EXPECT_EQ(args.symbol, "TEST");
    EXPECT_EQ(args.uri, "https://ipfs.io/ipfs/QmTestMetadata");
    EXPECT_EQ(args.creator, addresses.owner);
}

TEST_F(TransactionBuilderTest, NoFeeAndNoBuyGivesCreateOnly) {
    auto request = sample_request();
    request.priority_fee_sol = 0;
    request.initial_buy_sol = 0;
    auto plan = builder.build_create_and_buy(request, addresses);

    ASSERT_EQ(plan.instructions().size(), 1u);
    EXPECT_EQ(plan.instructions()[0].program_id, c.program_id);
}

TEST_F(TransactionBuilderTest, InvalidRequestIsRejectedBeforeBuilding) {
    auto request = sample_request();
    request.symbol = "WAYTOOLONGSYMBOL";
    EXPECT_THROW(builder.build_create_and_buy(request, addresses), ValidationError);
}

TEST_F(TransactionBuilderTest, SellUsesLiveBalanceAndMinOutput) {
    SellOrder order;
    order.priority_fee_lamports = 100000;
    order.min_sol_output = 4200;
    auto plan = builder.build_sell(order, addresses, 123456789);

    EXPECT_EQ(plan.label(), "sell");
    EXPECT_EQ(plan.required_signers(), (std::vector<PublicKey>{addresses.owner}));
    ASSERT_EQ(plan.instructions().size(), 3u);

    ByteReader limit(plan.instructions()[0].data);
    limit.get_u8();
    EXPECT_EQ(limit.get_u32(), 100000u);

    auto args = instruction_encoder::decode_sell(plan.instructions()[2].data, c);
    EXPECT_EQ(args.amount, 123456789u);
    EXPECT_EQ(args.min_sol_output, 4200u);
}

TEST_F(TransactionBuilderTest, SellOfZeroBalanceIsRejected) {
    EXPECT_THROW(builder.build_sell(SellOrder{}, addresses, 0), ValidationError);
}

TEST_F(TransactionBuilderTest, BuyAccountOrder) {
    auto ix = builder.buy_instruction({1, 2}, addresses);
    ASSERT_EQ(ix.accounts.size(), 16u);
    EXPECT_EQ(ix.accounts[1], AccountMeta::writable(c.buy_fee_recipient));
    EXPECT_EQ(ix.accounts[5], AccountMeta::writable(addresses.user_token_account.address));
    EXPECT_EQ(ix.accounts[6], AccountMeta::writable(addresses.owner, true));
    EXPECT_EQ(ix.accounts[8], AccountMeta::readonly(c.token_program));
    EXPECT_EQ(ix.accounts[9], AccountMeta::writable(addresses.creator_vault.address));
    EXPECT_EQ(ix.accounts[12], AccountMeta::writable(addresses.global_volume_accumulator.address));
    EXPECT_EQ(ix.accounts[13], AccountMeta::writable(addresses.user_volume_accumulator.address));
    EXPECT_EQ(ix.accounts[15], AccountMeta::readonly(c.fee_program));
}

TEST_F(TransactionBuilderTest, SellAccountOrder) {
    auto ix = builder.sell_instruction({1, 2}, addresses);
    ASSERT_EQ(ix.accounts.size(), 14u);
    EXPECT_EQ(ix.accounts[1], AccountMeta::writable(c.sell_fee_recipient));
    EXPECT_EQ(ix.accounts[8], AccountMeta::writable(addresses.creator_vault.address));
    EXPECT_EQ(ix.accounts[9], AccountMeta::readonly(c.token_program));
    EXPECT_EQ(ix.accounts[12], AccountMeta::readonly(c.fee_config));
}

TEST_F(TransactionBuilderTest, CreateAccountOrder) {
    auto ix = builder.create_instruction(sample_request(), addresses);
    ASSERT_EQ(ix.accounts.size(), 14u);
    EXPECT_EQ(ix.accounts[0], AccountMeta::writable(addresses.mint, true));
    EXPECT_EQ(ix.accounts[2], AccountMeta::writable(addresses.bonding_curve.address));
    EXPECT_EQ(ix.accounts[6], AccountMeta::writable(addresses.metadata.address));
    EXPECT_EQ(ix.accounts[7], AccountMeta::writable(addresses.owner, true));
    EXPECT_EQ(ix.accounts[12], AccountMeta::readonly(c.event_authority));
    EXPECT_EQ(ix.accounts[13], AccountMeta::readonly(c.program_id));
}

TEST_F(TransactionBuilderTest, SchemaCheckAcceptsBuiltInstructions) {
    EXPECT_NO_THROW(check_account_schema(builder.create_instruction(sample_request(), addresses), c));
    EXPECT_NO_THROW(check_account_schema(builder.buy_instruction({1, 2}, addresses), c));
    EXPECT_NO_THROW(check_account_schema(builder.sell_instruction({1, 2}, addresses), c));
}

TEST_F(TransactionBuilderTest, SchemaCheckCatchesSwappedAccounts) {
    auto ix = builder.sell_instruction({1, 2}, addresses);
    std::swap(ix.accounts[8], ix.accounts[9]);
    EXPECT_THROW(check_account_schema(ix, c), ContractViolation);
}

TEST_F(TransactionBuilderTest, SchemaCheckCatchesWrongFlagsAndAddresses) {
    auto ix = builder.buy_instruction({1, 2}, addresses);
    ix.accounts[3].is_writable = false;
    EXPECT_THROW(check_account_schema(ix, c), ContractViolation);

    ix = builder.buy_instruction({1, 2}, addresses);
    ix.accounts[0].pubkey = counting_key(77);
    EXPECT_THROW(check_account_schema(ix, c), ContractViolation);

    ix = builder.buy_instruction({1, 2}, addresses);
    ix.accounts.pop_back();
    EXPECT_THROW(check_account_schema(ix, c), ContractViolation);
}

TEST_F(TransactionBuilderTest, SchemaCheckCatchesForeignProgramAndData) {
    auto ix = builder.buy_instruction({1, 2}, addresses);
    ix.program_id = c.token_program;
    EXPECT_THROW(check_account_schema(ix, c), ContractViolation);

    ix = builder.buy_instruction({1, 2}, addresses);
    ix.data = {0, 1, 2, 3, 4, 5, 6, 7};
    EXPECT_THROW(check_account_schema(ix, c), ContractViolation);
}

TEST_F(TransactionBuilderTest, CreateAndBuyFitsInOnePacket) {
    auto plan = builder.build_create_and_buy(sample_request(), addresses);
    auto message = Message::compile(plan.instructions(), plan.payer(), counting_key(60));

    SignedTransaction tx;
    tx.message = message;
    tx.signatures.resize(message.header.num_required_signatures);
    EXPECT_EQ(tx.signatures.size(), 2u);
    EXPECT_LE(tx.serialize().size(), SignedTransaction::PACKET_DATA_SIZE);
}

TEST(TransactionBuilderConfigTest, RejectsFeeAboveDenominator) {
    EXPECT_THROW(TransactionBuilder(c, ComputeUnits{}, 10001), ValidationError);
}
