#pragma once
#include "constants.hpp"
#include "instruction_encoder.hpp"
#include "pda.hpp"
#include "transaction.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One position in a program instruction's account list
struct AccountSpec {
    std::string role;
    bool signer = false;
    bool writable = false;
    // Set where the role is a program constant
    std::optional<PublicKey> address;
};

using AccountSchema = std::vector<AccountSpec>;

// Account lists the bonding-curve program expects, per instruction kind
AccountSchema account_schema(InstructionKind kind, const ProtocolConstants& c);

// Throws ContractViolation on any deviation in program, tag, length, order or flags
void check_account_schema(const Instruction& ix, const ProtocolConstants& c);

struct ComputeUnits {
    uint32_t create = 300000;
    uint32_t sell = 100000;
};

struct SellOrder {
    uint64_t priority_fee_lamports = 0;
    uint64_t min_sol_output = 0;
};

class TransactionBuilder {
public:
    TransactionBuilder(const ProtocolConstants& constants, ComputeUnits units, uint64_t buy_fee_bps = 0);

    // [limit, price] when a priority fee is set, create, then [ensure ATA, buy]
    // when the request carries an initial buy. Signers: owner and mint.
    TransactionPlan build_create_and_buy(const LaunchRequest& request, const LaunchAddresses& addresses) const;

    // live_balance must come from the chain right before this call
    TransactionPlan build_sell(const SellOrder& order, const LaunchAddresses& addresses,
                               uint64_t live_balance) const;

    // Token amount and max cost for spending sol_in against a fresh curve
    BuyArgs quote_initial_buy(uint64_t sol_in, double slippage_pct) const;

    Instruction create_instruction(const LaunchRequest& request, const LaunchAddresses& addresses) const;
    Instruction buy_instruction(const BuyArgs& args, const LaunchAddresses& addresses) const;
    Instruction sell_instruction(const SellArgs& args, const LaunchAddresses& addresses) const;

private:
    void add_priority_fee(std::vector<Instruction>& instructions, uint64_t fee_lamports, uint32_t units) const;

    const ProtocolConstants& constants_;
    ComputeUnits units_;
    uint64_t buy_fee_bps_;
};
