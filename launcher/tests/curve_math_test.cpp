#include "curve_math.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include "instruction_encoder.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace {

const ProtocolConstants& c = ProtocolConstants::mainnet();

std::vector<uint8_t> curve_account(uint64_t vtok, uint64_t vsol, bool complete, bool with_creator) {
    ByteWriter writer;
    writer.put_bytes(std::vector<uint8_t>{0x17, 0xb7, 0xf8, 0x37, 0x60, 0xd8, 0xac, 0x60});
    writer.put_u64(vtok);
    writer.put_u64(vsol);
    writer.put_u64(793100000000000ULL);
    writer.put_u64(0);
    writer.put_u64(1000000000000000ULL);
    writer.put_u8(complete ? 1 : 0);
    if (with_creator) {
        writer.put_bytes(std::vector<uint8_t>(32, 0xab));
    }
    return writer.release();
}

} // namespace

TEST(CurveMathTest, SmallConstantProductExample) {
    // 1_000_000 tokens, 100 lamports of reserves, buying with 1_000 lamports
    EXPECT_EQ(curve::quote_buy(1000, 1000000, 100, 0), 909090u);
    // Selling 100 tokens into 1_000 tokens / 1_000_000 lamports
    EXPECT_EQ(curve::quote_sell(100, 1000, 1000000, 0), 90909u);
}

TEST(CurveMathTest, BuyWithSmallSolReserve) {
    // 100 lamports into 1_000_000 tokens / 1_000 lamports of reserves
    EXPECT_EQ(curve::quote_buy(100, 1000000, 1000, 0), 90909u);
}

TEST(CurveMathTest, BuyIsMonotoneInInput) {
    for (uint64_t fee_bps : {0ULL, 250ULL}) {
        uint64_t previous = 0;
        for (uint64_t sol_in = 0; sol_in <= 200000; sol_in += 97) {
            uint64_t tokens = curve::quote_buy(sol_in, 1000000, 1000, fee_bps);
            EXPECT_GE(tokens, previous) << "sol_in=" << sol_in << " fee_bps=" << fee_bps;
            EXPECT_LT(tokens, 1000000u);
            previous = tokens;
        }
    }
}

TEST(CurveMathTest, BuyIsMonotoneAgainstFreshCurve) {
    uint64_t previous = 0;
    for (uint64_t sol_in = 0; sol_in <= 85000000000ULL; sol_in += 1700000000ULL) {
        uint64_t tokens = curve::quote_buy(sol_in, c.initial_virtual_token_reserves, c.initial_virtual_sol_reserves, 100);
        EXPECT_GE(tokens, previous);
        EXPECT_LT(tokens, c.initial_virtual_token_reserves);
        previous = tokens;
    }
}

TEST(CurveMathTest, DefaultInitialBuyAgainstFreshCurve) {
    uint64_t tokens = curve::quote_buy(10000000, c.initial_virtual_token_reserves,
                                       c.initial_virtual_sol_reserves, 0);
    EXPECT_EQ(tokens, 357547484171ULL);
}

TEST(CurveMathTest, BuyFeeReducesTokensOut) {
    uint64_t no_fee = curve::quote_buy(10000000, c.initial_virtual_token_reserves, c.initial_virtual_sol_reserves, 0);
    uint64_t with_fee =
        curve::quote_buy(10000000, c.initial_virtual_token_reserves, c.initial_virtual_sol_reserves, 100);
    EXPECT_LT(with_fee, no_fee);
}

TEST(CurveMathTest, SellFeeTakenFromOutput) {
    EXPECT_EQ(curve::quote_sell(100, 1000, 1000000, 100), 89999u);
}

TEST(CurveMathTest, QuotesNeverExceedReserves) {
    uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_LT(curve::quote_buy(max, 1000, 1000, 0), 1000u);
    EXPECT_LT(curve::quote_sell(max, 1000, 1000, 0), 1000u);
}

TEST(CurveMathTest, ZeroReservesAreRejected) {
    EXPECT_THROW(curve::quote_buy(1, 0, 100, 0), InvalidReserves);
    EXPECT_THROW(curve::quote_buy(1, 100, 0, 0), InvalidReserves);
    EXPECT_THROW(curve::quote_sell(1, 0, 100, 0), InvalidReserves);
}

TEST(CurveMathTest, InvalidReservesIsACurveError) {
    EXPECT_THROW(curve::quote_sell(1, 100, 0, 0), CurveError);
}

TEST(CurveMathTest, FeeAboveDenominatorIsRejected) {
    EXPECT_THROW(curve::quote_buy(1, 100, 100, 10001), ValidationError);
}

TEST(CurveMathTest, SlippageBounds) {
    EXPECT_EQ(curve::max_sol_cost(10000000, 10.0), 11000000u);
    EXPECT_EQ(curve::max_sol_cost(10000000, 0.0), 10000000u);
    EXPECT_EQ(curve::min_sol_output(1000000, 5.0), 950000u);
    EXPECT_EQ(curve::min_sol_output(1000000, 100.0), 0u);
    EXPECT_EQ(curve::max_sol_cost(std::numeric_limits<uint64_t>::max(), 50.0),
              std::numeric_limits<uint64_t>::max());
}

TEST(CurveMathTest, SlippageOutOfRangeIsRejected) {
    EXPECT_THROW(curve::max_sol_cost(1, -1.0), ValidationError);
    EXPECT_THROW(curve::min_sol_output(1, 100.5), ValidationError);
}

TEST(BondingCurveStateTest, DecodesAccountWithCreator) {
    auto state = BondingCurveState::decode(curve_account(1000, 2000, false, true));
    EXPECT_EQ(state.virtual_token_reserves, 1000u);
    EXPECT_EQ(state.virtual_sol_reserves, 2000u);
    EXPECT_EQ(state.real_token_reserves, 793100000000000ULL);
    EXPECT_EQ(state.token_total_supply, 1000000000000000ULL);
    EXPECT_FALSE(state.complete);
    EXPECT_EQ(state.creator.bytes[0], 0xab);
}

TEST(BondingCurveStateTest, DecodesOlderAccountWithoutCreator) {
    auto state = BondingCurveState::decode(curve_account(5, 6, true, false));
    EXPECT_TRUE(state.complete);
    EXPECT_EQ(state.creator, PublicKey());
}

TEST(BondingCurveStateTest, ShortAccountIsRejected) {
    EXPECT_THROW(BondingCurveState::decode(std::vector<uint8_t>(20, 0)), DecodeError);
}
