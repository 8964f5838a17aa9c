#pragma once
#include "pubkey.hpp"
#include <cstdint>
#include <vector>

// Snapshot of a bonding-curve account as read from chain
struct BondingCurveState {
    uint64_t virtual_token_reserves = 0;
    uint64_t virtual_sol_reserves = 0;
    uint64_t real_token_reserves = 0;
    uint64_t real_sol_reserves = 0;
    uint64_t token_total_supply = 0;
    bool complete = false;
    PublicKey creator;

    // Anchor account layout: 8-byte tag, five u64, bool, creator key (older
    // accounts end before the creator).
    static BondingCurveState decode(const std::vector<uint8_t>& data);
};

namespace curve {

constexpr uint64_t BPS_DENOMINATOR = 10000;

// Constant-product quote with the fee taken from the input before the swap.
// Throws InvalidReserves when either reserve is zero.
uint64_t quote_buy(uint64_t sol_in, uint64_t virtual_token_reserves,
                   uint64_t virtual_sol_reserves, uint64_t fee_bps);

// Lamports returned for selling tokens_in, fee taken from the output.
uint64_t quote_sell(uint64_t tokens_in, uint64_t virtual_token_reserves,
                    uint64_t virtual_sol_reserves, uint64_t fee_bps);

// floor(sol_in * (1 + slippage_pct / 100)), slippage rounded to whole bps;
// saturates at u64 max
uint64_t max_sol_cost(uint64_t sol_in, double slippage_pct);

// floor(expected * (1 - slippage_pct / 100))
uint64_t min_sol_output(uint64_t expected, double slippage_pct);

} // namespace curve
