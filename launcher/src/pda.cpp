#include "pda.hpp"
#include "errors.hpp"
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <memory>
#include <optional>
#include <stdexcept>

namespace pda {

namespace {

const std::string PDA_MARKER = "ProgramDerivedAddress";

using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;

BnPtr make_bn() {
    BnPtr bn(BN_new(), &BN_free);
    if (!bn) {
        throw std::runtime_error("BN_new failed");
    }
    return bn;
}

BnPtr bn_from_hex(const char* hex) {
    BIGNUM* raw = nullptr;
    if (BN_hex2bn(&raw, hex) == 0) {
        throw std::runtime_error("BN_hex2bn failed");
    }
    return BnPtr(raw, &BN_free);
}

// Field prime 2^255 - 19 and the curve constant d = -121665/121666
struct CurveParams {
    BnPtr p = bn_from_hex("7fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffed");
    BnPtr d = bn_from_hex("52036cee2b6ffe738cc740797779e89800700a4d4141d8ab75eb4dca135978a3");
    BnPtr one = bn_from_hex("1");
};

const CurveParams& curve_params() {
    static const CurveParams params;
    return params;
}

void check(int rc, const char* what) {
    if (rc != 1) {
        throw std::runtime_error(std::string("BIGNUM operation failed: ") + what);
    }
}

} // namespace

std::vector<uint8_t> seed(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::vector<uint8_t> seed(const PublicKey& key) {
    return key.to_vector();
}

bool is_on_curve(const PublicKey& key) {
    const auto& params = curve_params();
    BnCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    if (!ctx) {
        throw std::runtime_error("BN_CTX_new failed");
    }

    // y is little-endian with the x sign bit in the top bit
    auto encoded = key.bytes;
    encoded[31] &= 0x7f;

    auto y = make_bn();
    if (!BN_lebin2bn(encoded.data(), static_cast<int>(encoded.size()), y.get())) {
        throw std::runtime_error("BN_lebin2bn failed");
    }
    check(BN_nnmod(y.get(), y.get(), params.p.get(), ctx.get()), "nnmod");

    // x^2 = (y^2 - 1) / (d*y^2 + 1)
    auto y2 = make_bn();
    auto u = make_bn();
    auto v = make_bn();
    auto w = make_bn();
    check(BN_mod_sqr(y2.get(), y.get(), params.p.get(), ctx.get()), "sqr");
    check(BN_mod_sub(u.get(), y2.get(), params.one.get(), params.p.get(), ctx.get()), "sub");
    check(BN_mod_mul(v.get(), params.d.get(), y2.get(), params.p.get(), ctx.get()), "mul");
    check(BN_mod_add(v.get(), v.get(), params.one.get(), params.p.get(), ctx.get()), "add");
    if (!BN_mod_inverse(v.get(), v.get(), params.p.get(), ctx.get())) {
        throw std::runtime_error("BN_mod_inverse failed");
    }
    check(BN_mod_mul(w.get(), u.get(), v.get(), params.p.get(), ctx.get()), "mul");

    if (BN_is_zero(w.get())) {
        return true;
    }

    // Decompressible iff x^2 is a quadratic residue mod p
    int symbol = BN_kronecker(w.get(), params.p.get(), ctx.get());
    if (symbol == -2) {
        throw std::runtime_error("BN_kronecker failed");
    }
    return symbol == 1;
}

namespace {

void validate_seeds(const Seeds& seeds) {
    if (seeds.size() > MAX_SEEDS) {
        throw DerivationError("Too many seeds: " + std::to_string(seeds.size()));
    }
    for (const auto& s : seeds) {
        if (s.size() > MAX_SEED_LENGTH) {
            throw DerivationError("Seed exceeds 32 bytes: " + std::to_string(s.size()));
        }
    }
}

// Empty when the candidate lands on the curve
std::optional<PublicKey> try_create_program_address(const Seeds& seeds, const PublicKey& program_id) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
    for (const auto& s : seeds) {
        ok = ok && EVP_DigestUpdate(ctx, s.data(), s.size()) == 1;
    }
    ok = ok && EVP_DigestUpdate(ctx, program_id.bytes.data(), program_id.bytes.size()) == 1;
    ok = ok && EVP_DigestUpdate(ctx, PDA_MARKER.data(), PDA_MARKER.size()) == 1;

    std::array<uint8_t, PublicKey::SIZE> hash{};
    unsigned int hash_len = 0;
    ok = ok && EVP_DigestFinal_ex(ctx, hash.data(), &hash_len) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok || hash_len != hash.size()) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    PublicKey candidate(hash);
    if (is_on_curve(candidate)) {
        return std::nullopt;
    }
    return candidate;
}

} // namespace

PublicKey create_program_address(const Seeds& seeds, const PublicKey& program_id) {
    validate_seeds(seeds);
    auto address = try_create_program_address(seeds, program_id);
    if (!address) {
        throw DerivationError("Derived address is on the ed25519 curve");
    }
    return *address;
}

ProgramAddress find_program_address(const Seeds& seeds, const PublicKey& program_id) {
    Seeds with_bump = seeds;
    with_bump.push_back({0});
    validate_seeds(with_bump);

    for (int bump = 255; bump >= 0; --bump) {
        with_bump.back()[0] = static_cast<uint8_t>(bump);
        if (auto address = try_create_program_address(with_bump, program_id)) {
            return {*address, static_cast<uint8_t>(bump)};
        }
    }

    throw DerivationError("Unable to find a viable program address bump seed");
}

ProgramAddress bonding_curve(const PublicKey& mint, const ProtocolConstants& c) {
    return find_program_address({seed("bonding-curve"), seed(mint)}, c.program_id);
}

ProgramAddress associated_token_account(const PublicKey& owner, const PublicKey& mint, const ProtocolConstants& c) {
    return find_program_address({seed(owner), seed(c.token_program), seed(mint)}, c.associated_token_program);
}

ProgramAddress metadata(const PublicKey& mint, const ProtocolConstants& c) {
    return find_program_address({seed("metadata"), seed(c.metadata_program), seed(mint)}, c.metadata_program);
}

ProgramAddress creator_vault(const PublicKey& creator, const ProtocolConstants& c) {
    return find_program_address({seed("creator-vault"), seed(creator)}, c.program_id);
}

ProgramAddress global_volume_accumulator(const ProtocolConstants& c) {
    return find_program_address({seed("global_volume_accumulator")}, c.program_id);
}

ProgramAddress user_volume_accumulator(const PublicKey& owner, const ProtocolConstants& c) {
    return find_program_address({seed("user_volume_accumulator"), seed(owner)}, c.program_id);
}

ProgramAddress event_authority(const ProtocolConstants& c) {
    return find_program_address({seed("__event_authority")}, c.program_id);
}

ProgramAddress fee_config(const ProtocolConstants& c) {
    return find_program_address({seed("fee_config"), seed(c.program_id)}, c.fee_program);
}

LaunchAddresses derive_launch_addresses(const PublicKey& mint, const PublicKey& owner,
                                        const ProtocolConstants& c) {
    LaunchAddresses a;
    a.mint = mint;
    a.owner = owner;
    a.bonding_curve = bonding_curve(mint, c);
    a.associated_bonding_curve = associated_token_account(a.bonding_curve.address, mint, c);
    a.metadata = metadata(mint, c);
    // The launching wallet is the token creator
    a.creator_vault = creator_vault(owner, c);
    a.global_volume_accumulator = global_volume_accumulator(c);
    a.user_volume_accumulator = user_volume_accumulator(owner, c);
    a.event_authority = event_authority(c);
    a.fee_config = fee_config(c);
    a.user_token_account = associated_token_account(owner, mint, c);
    return a;
}

} // namespace pda
