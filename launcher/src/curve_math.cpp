#include "curve_math.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace {

// Reserve products overflow u64; needs the GCC/Clang 128-bit extension
using uint128 = unsigned __int128;

uint64_t read_u64_le(const std::vector<uint8_t>& data, size_t offset) {
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
    }
    return value;
}

void check_reserves(uint64_t virtual_token_reserves, uint64_t virtual_sol_reserves) {
    if (virtual_token_reserves == 0 || virtual_sol_reserves == 0) {
        throw InvalidReserves("Reserves must be positive (tokens=" + std::to_string(virtual_token_reserves) +
                              ", sol=" + std::to_string(virtual_sol_reserves) + ")");
    }
}

void check_fee(uint64_t fee_bps) {
    if (fee_bps > curve::BPS_DENOMINATOR) {
        throw ValidationError("Fee exceeds 10000 bps: " + std::to_string(fee_bps));
    }
}

// Percent to basis points, rounded to the nearest bp
uint64_t slippage_bps(double slippage_pct) {
    if (std::isnan(slippage_pct) || slippage_pct < 0.0 || slippage_pct > 100.0) {
        throw ValidationError("Slippage must be between 0 and 100");
    }
    return static_cast<uint64_t>(std::llround(slippage_pct * 100.0));
}

} // namespace

BondingCurveState BondingCurveState::decode(const std::vector<uint8_t>& data) {
    constexpr size_t base_size = 8 + 5 * 8 + 1;
    if (data.size() < base_size) {
        throw DecodeError("Bonding curve account too short: " + std::to_string(data.size()) + " bytes");
    }

    BondingCurveState state;
    state.virtual_token_reserves = read_u64_le(data, 8);
    state.virtual_sol_reserves = read_u64_le(data, 16);
    state.real_token_reserves = read_u64_le(data, 24);
    state.real_sol_reserves = read_u64_le(data, 32);
    state.token_total_supply = read_u64_le(data, 40);
    state.complete = data[48] != 0;
    if (data.size() >= base_size + PublicKey::SIZE) {
        std::copy(data.begin() + base_size, data.begin() + base_size + PublicKey::SIZE,
                  state.creator.bytes.begin());
    }
    return state;
}

namespace curve {

uint64_t quote_buy(uint64_t sol_in, uint64_t virtual_token_reserves,
                   uint64_t virtual_sol_reserves, uint64_t fee_bps) {
    check_reserves(virtual_token_reserves, virtual_sol_reserves);
    check_fee(fee_bps);

    uint128 effective_in = static_cast<uint128>(sol_in) * (BPS_DENOMINATOR - fee_bps) / BPS_DENOMINATOR;
    uint128 numerator = static_cast<uint128>(virtual_token_reserves) * effective_in;
    uint128 denominator = static_cast<uint128>(virtual_sol_reserves) + effective_in;

    // Strictly below virtual_token_reserves, so it fits
    return static_cast<uint64_t>(numerator / denominator);
}

uint64_t quote_sell(uint64_t tokens_in, uint64_t virtual_token_reserves,
                    uint64_t virtual_sol_reserves, uint64_t fee_bps) {
    check_reserves(virtual_token_reserves, virtual_sol_reserves);
    check_fee(fee_bps);

    uint128 gross = static_cast<uint128>(virtual_sol_reserves) * tokens_in /
                    (static_cast<uint128>(virtual_token_reserves) + tokens_in);
    uint128 net = gross * (BPS_DENOMINATOR - fee_bps) / BPS_DENOMINATOR;
    return static_cast<uint64_t>(net);
}

uint64_t max_sol_cost(uint64_t sol_in, double slippage_pct) {
    uint128 cost = static_cast<uint128>(sol_in) * (BPS_DENOMINATOR + slippage_bps(slippage_pct)) / BPS_DENOMINATOR;
    if (cost > std::numeric_limits<uint64_t>::max()) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(cost);
}

uint64_t min_sol_output(uint64_t expected, double slippage_pct) {
    uint128 out = static_cast<uint128>(expected) * (BPS_DENOMINATOR - slippage_bps(slippage_pct)) / BPS_DENOMINATOR;
    return static_cast<uint64_t>(out);
}

} // namespace curve
