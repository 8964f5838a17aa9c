#pragma once
#include "pubkey.hpp"
#include <array>
#include <cstdint>
#include <string>

// Addresses and tags of the bonding-curve program and the programs it calls.
// Nothing detects an upstream change; a new deployment means a new table.
struct ProtocolConstants {
    std::string version;

    PublicKey program_id;
    PublicKey global_config;
    PublicKey mint_authority;
    PublicKey event_authority;
    PublicKey fee_program;
    PublicKey fee_config;
    PublicKey buy_fee_recipient;
    PublicKey sell_fee_recipient;

    PublicKey metadata_program;
    PublicKey system_program;
    PublicKey token_program;
    PublicKey associated_token_program;
    PublicKey rent_sysvar;
    PublicKey compute_budget_program;

    std::array<uint8_t, 8> create_discriminator{};
    std::array<uint8_t, 8> buy_discriminator{};
    std::array<uint8_t, 8> sell_discriminator{};

    // Reserves of a freshly created curve
    uint64_t initial_virtual_token_reserves = 0;
    uint64_t initial_virtual_sol_reserves = 0;
    int token_decimals = 6;

    static const ProtocolConstants& mainnet();
};
