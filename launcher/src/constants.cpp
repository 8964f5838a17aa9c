#include "constants.hpp"

namespace {

ProtocolConstants build_mainnet() {
    ProtocolConstants c;
    c.version = "pump-2025.09";

    c.program_id = PublicKey::from_base58("6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P");
    c.global_config = PublicKey::from_base58("4wTV1YmiEkRvAtNtsSGPtUrqRYQMe5SKy2uB4Jjaxnjf");
    c.mint_authority = PublicKey::from_base58("TSLvdd1pWpHVjahSpsvCXUbgwsL3JAcvokwaKt1eokM");
    c.event_authority = PublicKey::from_base58("Ce6TQqeHC9p8KetsN6JsjHK7UTZk7nasjjnr7XxXp9F1");
    c.fee_program = PublicKey::from_base58("pfeeUxB6jkeY1Hxd7CsFCAjcbHA9rWtchMGdZ6VojVZ");
    c.fee_config = PublicKey::from_base58("8Wf5TiAheLUqBrKXeYg2JtAFFMWtKdG2BSFgqUcPVwTt");
    // Fee recipients rotate upstream; both are accepted by the program
    c.buy_fee_recipient = PublicKey::from_base58("CebN5WGQ4jvEPvsVU4EoHEpgzq1VV7AbicfhtW4xC9iM");
    c.sell_fee_recipient = PublicKey::from_base58("62qc2CNXwrYqQScmEdiZFFAnJR262PxWEuNQtxfafNgV");

    c.metadata_program = PublicKey::from_base58("metaqbxxUerdq28cj1RbAWkYQm3ybzjb6a8bt518x1s");
    c.system_program = PublicKey::from_base58("11111111111111111111111111111111");
    c.token_program = PublicKey::from_base58("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
    c.associated_token_program = PublicKey::from_base58("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL");
    c.rent_sysvar = PublicKey::from_base58("SysvarRent111111111111111111111111111111111");
    c.compute_budget_program = PublicKey::from_base58("ComputeBudget111111111111111111111111111111");

    c.create_discriminator = {0x18, 0x1e, 0xc8, 0x28, 0x05, 0x1c, 0x07, 0x77};
    c.buy_discriminator = {0x66, 0x06, 0x3d, 0x12, 0x01, 0xda, 0xeb, 0xea};
    c.sell_discriminator = {0x33, 0xe6, 0x85, 0xa4, 0x01, 0x7f, 0x83, 0xad};

    c.initial_virtual_token_reserves = 1073000000000000ULL;
    c.initial_virtual_sol_reserves = 30000000000ULL;
    c.token_decimals = 6;
    return c;
}

} // namespace

const ProtocolConstants& ProtocolConstants::mainnet() {
    static const ProtocolConstants constants = build_mainnet();
    return constants;
}
