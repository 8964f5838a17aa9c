#include "transaction_builder.hpp"
#include "curve_math.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

AccountSpec fixed(const std::string& role, const PublicKey& address, bool writable = false) {
    return {role, false, writable, address};
}

AccountSpec derived(const std::string& role, bool writable) {
    return {role, false, writable, std::nullopt};
}

AccountSpec signer(const std::string& role) {
    return {role, true, true, std::nullopt};
}

} // namespace

AccountSchema account_schema(InstructionKind kind, const ProtocolConstants& c) {
    switch (kind) {
        case InstructionKind::Create:
            return {
                {"mint", true, true, std::nullopt},
                fixed("mint_authority", c.mint_authority),
                derived("bonding_curve", true),
                derived("associated_bonding_curve", true),
                fixed("global", c.global_config),
                fixed("metadata_program", c.metadata_program),
                derived("metadata", true),
                signer("user"),
                fixed("system_program", c.system_program),
                fixed("token_program", c.token_program),
                fixed("associated_token_program", c.associated_token_program),
                fixed("rent", c.rent_sysvar),
                fixed("event_authority", c.event_authority),
                fixed("program", c.program_id),
            };
        case InstructionKind::Buy:
            // Token program precedes the creator vault here, unlike sell
            return {
                fixed("global", c.global_config),
                fixed("fee_recipient", c.buy_fee_recipient, true),
                derived("mint", false),
                derived("bonding_curve", true),
                derived("associated_bonding_curve", true),
                derived("associated_user", true),
                signer("user"),
                fixed("system_program", c.system_program),
                fixed("token_program", c.token_program),
                derived("creator_vault", true),
                fixed("event_authority", c.event_authority),
                fixed("program", c.program_id),
                derived("global_volume_accumulator", true),
                derived("user_volume_accumulator", true),
                fixed("fee_config", c.fee_config),
                fixed("fee_program", c.fee_program),
            };
        case InstructionKind::Sell:
            return {
                fixed("global", c.global_config),
                fixed("fee_recipient", c.sell_fee_recipient, true),
                derived("mint", false),
                derived("bonding_curve", true),
                derived("associated_bonding_curve", true),
                derived("associated_user", true),
                signer("user"),
                fixed("system_program", c.system_program),
                derived("creator_vault", true),
                fixed("token_program", c.token_program),
                fixed("event_authority", c.event_authority),
                fixed("program", c.program_id),
                fixed("fee_config", c.fee_config),
                fixed("fee_program", c.fee_program),
            };
    }
    throw ContractViolation("No schema for instruction kind");
}

void check_account_schema(const Instruction& ix, const ProtocolConstants& c) {
    if (ix.program_id != c.program_id) {
        throw ContractViolation("Instruction targets " + ix.program_id.to_base58() +
                                ", expected " + c.program_id.to_base58());
    }

    InstructionKind kind;
    try {
        kind = instruction_encoder::kind_of(ix.data, c);
    } catch (const DecodeError& e) {
        throw ContractViolation(std::string("Unrecognised instruction data: ") + e.what());
    }

    auto schema = account_schema(kind, c);
    if (ix.accounts.size() != schema.size()) {
        throw ContractViolation(fmt::format("{} instruction has {} accounts, expected {}",
                                            to_string(kind), ix.accounts.size(), schema.size()));
    }

    for (size_t i = 0; i < schema.size(); ++i) {
        const auto& spec = schema[i];
        const auto& meta = ix.accounts[i];
        if (meta.is_signer != spec.signer || meta.is_writable != spec.writable) {
            throw ContractViolation(fmt::format("{} account #{} ({}) has signer={} writable={}, expected {} {}",
                                                to_string(kind), i + 1, spec.role, meta.is_signer,
                                                meta.is_writable, spec.signer, spec.writable));
        }
        if (spec.address && meta.pubkey != *spec.address) {
            throw ContractViolation(fmt::format("{} account #{} ({}) is {}, expected {}",
                                                to_string(kind), i + 1, spec.role,
                                                meta.pubkey.to_base58(), spec.address->to_base58()));
        }
    }
}

TransactionBuilder::TransactionBuilder(const ProtocolConstants& constants, ComputeUnits units, uint64_t buy_fee_bps)
    : constants_(constants), units_(units), buy_fee_bps_(buy_fee_bps) {
    if (buy_fee_bps_ > curve::BPS_DENOMINATOR) {
        throw ValidationError("BUY_FEE_BPS must not exceed 10000");
    }
}

TransactionPlan TransactionBuilder::build_create_and_buy(const LaunchRequest& request,
                                                         const LaunchAddresses& addresses) const {
    request.validate();
    uint64_t buy_lamports = util::sol_to_lamports(request.initial_buy_sol);
    uint64_t fee_lamports = util::sol_to_lamports(request.priority_fee_sol);

    std::vector<Instruction> instructions;
    add_priority_fee(instructions, fee_lamports, units_.create);

    auto create = create_instruction(request, addresses);
    check_account_schema(create, constants_);
    instructions.push_back(std::move(create));

    if (buy_lamports > 0) {
        auto args = quote_initial_buy(buy_lamports, request.slippage_pct);
        spdlog::debug("Initial buy: {} lamports for {} tokens, max cost {}", buy_lamports, args.amount,
                      args.max_sol_cost);

        instructions.push_back(create_associated_token_account_idempotent(
            addresses.owner, addresses.user_token_account.address, addresses.owner, addresses.mint, constants_));

        auto buy = buy_instruction(args, addresses);
        check_account_schema(buy, constants_);
        instructions.push_back(std::move(buy));
    }

    return TransactionPlan("create_and_buy", addresses.owner, std::move(instructions),
                           {addresses.owner, addresses.mint});
}

TransactionPlan TransactionBuilder::build_sell(const SellOrder& order, const LaunchAddresses& addresses,
                                               uint64_t live_balance) const {
    if (live_balance == 0) {
        throw ValidationError("Token balance for " + addresses.mint.to_base58() + " is zero; nothing to sell");
    }

    std::vector<Instruction> instructions;
    add_priority_fee(instructions, order.priority_fee_lamports, units_.sell);

    SellArgs args;
    args.amount = live_balance;
    args.min_sol_output = order.min_sol_output;
    auto sell = sell_instruction(args, addresses);
    check_account_schema(sell, constants_);
    instructions.push_back(std::move(sell));

    return TransactionPlan("sell", addresses.owner, std::move(instructions), {addresses.owner});
}

BuyArgs TransactionBuilder::quote_initial_buy(uint64_t sol_in, double slippage_pct) const {
    BuyArgs args;
    args.amount = curve::quote_buy(sol_in, constants_.initial_virtual_token_reserves,
                                   constants_.initial_virtual_sol_reserves, buy_fee_bps_);
    args.max_sol_cost = curve::max_sol_cost(sol_in, slippage_pct);
    return args;
}

Instruction TransactionBuilder::create_instruction(const LaunchRequest& request,
                                                   const LaunchAddresses& a) const {
    const auto& c = constants_;
    CreateArgs args{request.name, request.symbol, request.metadata_url, a.owner};
    return {c.program_id,
            {
                AccountMeta::writable(a.mint, true),
                AccountMeta::readonly(c.mint_authority),
                AccountMeta::writable(a.bonding_curve.address),
                AccountMeta::writable(a.associated_bonding_curve.address),
                AccountMeta::readonly(c.global_config),
                AccountMeta::readonly(c.metadata_program),
                AccountMeta::writable(a.metadata.address),
                AccountMeta::writable(a.owner, true),
                AccountMeta::readonly(c.system_program),
                AccountMeta::readonly(c.token_program),
                AccountMeta::readonly(c.associated_token_program),
                AccountMeta::readonly(c.rent_sysvar),
                AccountMeta::readonly(a.event_authority.address),
                AccountMeta::readonly(c.program_id),
            },
            instruction_encoder::encode_create(args, c)};
}

Instruction TransactionBuilder::buy_instruction(const BuyArgs& args, const LaunchAddresses& a) const {
    const auto& c = constants_;
    return {c.program_id,
            {
                AccountMeta::readonly(c.global_config),
                AccountMeta::writable(c.buy_fee_recipient),
                AccountMeta::readonly(a.mint),
                AccountMeta::writable(a.bonding_curve.address),
                AccountMeta::writable(a.associated_bonding_curve.address),
                AccountMeta::writable(a.user_token_account.address),
                AccountMeta::writable(a.owner, true),
                AccountMeta::readonly(c.system_program),
                AccountMeta::readonly(c.token_program),
                AccountMeta::writable(a.creator_vault.address),
                AccountMeta::readonly(a.event_authority.address),
                AccountMeta::readonly(c.program_id),
                AccountMeta::writable(a.global_volume_accumulator.address),
                AccountMeta::writable(a.user_volume_accumulator.address),
                AccountMeta::readonly(a.fee_config.address),
                AccountMeta::readonly(c.fee_program),
            },
            instruction_encoder::encode_buy(args, c)};
}

Instruction TransactionBuilder::sell_instruction(const SellArgs& args, const LaunchAddresses& a) const {
    const auto& c = constants_;
    return {c.program_id,
            {
                AccountMeta::readonly(c.global_config),
                AccountMeta::writable(c.sell_fee_recipient),
                AccountMeta::readonly(a.mint),
                AccountMeta::writable(a.bonding_curve.address),
                AccountMeta::writable(a.associated_bonding_curve.address),
                AccountMeta::writable(a.user_token_account.address),
                AccountMeta::writable(a.owner, true),
                AccountMeta::readonly(c.system_program),
                AccountMeta::writable(a.creator_vault.address),
                AccountMeta::readonly(c.token_program),
                AccountMeta::readonly(a.event_authority.address),
                AccountMeta::readonly(c.program_id),
                AccountMeta::readonly(a.fee_config.address),
                AccountMeta::readonly(c.fee_program),
            },
            instruction_encoder::encode_sell(args, c)};
}

void TransactionBuilder::add_priority_fee(std::vector<Instruction>& instructions, uint64_t fee_lamports,
                                          uint32_t units) const {
    if (fee_lamports == 0) {
        return;
    }
    instructions.push_back(compute_budget::set_compute_unit_limit(units, constants_));
    instructions.push_back(
        compute_budget::set_compute_unit_price(compute_budget::unit_price_for_fee(fee_lamports, units), constants_));
}
