#pragma once
#include "constants.hpp"
#include "pubkey.hpp"
#include <cstdint>
#include <string>
#include <vector>

using Seeds = std::vector<std::vector<uint8_t>>;

struct ProgramAddress {
    PublicKey address;
    uint8_t bump = 0;
};

// Every account a create/buy/sell for one mint touches. Pure function of
// (mint, owner, constants); computed once per request.
struct LaunchAddresses {
    PublicKey mint;
    PublicKey owner;
    ProgramAddress bonding_curve;
    ProgramAddress associated_bonding_curve;
    ProgramAddress metadata;
    ProgramAddress creator_vault;
    ProgramAddress global_volume_accumulator;
    ProgramAddress user_volume_accumulator;
    ProgramAddress event_authority;
    ProgramAddress fee_config;
    ProgramAddress user_token_account;
};

namespace pda {

constexpr size_t MAX_SEED_LENGTH = 32;
constexpr size_t MAX_SEEDS = 16;

std::vector<uint8_t> seed(const std::string& text);
std::vector<uint8_t> seed(const PublicKey& key);

// True when the 32 bytes decompress to a point on edwards25519.
bool is_on_curve(const PublicKey& key);

// sha256(seeds || program_id || "ProgramDerivedAddress"); throws DerivationError
// when the hash lands on the curve.
PublicKey create_program_address(const Seeds& seeds, const PublicKey& program_id);

// First off-curve candidate, bump searched from 255 down to 0.
ProgramAddress find_program_address(const Seeds& seeds, const PublicKey& program_id);

// Seed families of the bonding-curve program
ProgramAddress bonding_curve(const PublicKey& mint, const ProtocolConstants& c);
ProgramAddress associated_token_account(const PublicKey& owner, const PublicKey& mint, const ProtocolConstants& c);
ProgramAddress metadata(const PublicKey& mint, const ProtocolConstants& c);
ProgramAddress creator_vault(const PublicKey& creator, const ProtocolConstants& c);
ProgramAddress global_volume_accumulator(const ProtocolConstants& c);
ProgramAddress user_volume_accumulator(const PublicKey& owner, const ProtocolConstants& c);
ProgramAddress event_authority(const ProtocolConstants& c);
ProgramAddress fee_config(const ProtocolConstants& c);

LaunchAddresses derive_launch_addresses(const PublicKey& mint, const PublicKey& owner,
                                        const ProtocolConstants& c);

} // namespace pda
