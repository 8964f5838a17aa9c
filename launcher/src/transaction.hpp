#pragma once
#include "constants.hpp"
#include "pubkey.hpp"
#include <cstdint>
#include <string>
#include <vector>

using Blockhash = PublicKey;

struct AccountMeta {
    PublicKey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    static AccountMeta writable(const PublicKey& key, bool signer = false) { return {key, signer, true}; }
    static AccountMeta readonly(const PublicKey& key, bool signer = false) { return {key, signer, false}; }

    bool operator==(const AccountMeta& o) const {
        return pubkey == o.pubkey && is_signer == o.is_signer && is_writable == o.is_writable;
    }
};

struct Instruction {
    PublicKey program_id;
    std::vector<AccountMeta> accounts;
    std::vector<uint8_t> data;
};

// Ordered instructions plus the keys that must sign. Built once, never
// edited; a retry resubmits the same plan as a whole.
class TransactionPlan {
public:
    TransactionPlan(std::string label, PublicKey payer, std::vector<Instruction> instructions,
                    std::vector<PublicKey> required_signers);

    const std::string& label() const { return label_; }
    const PublicKey& payer() const { return payer_; }
    const std::vector<Instruction>& instructions() const { return instructions_; }
    const std::vector<PublicKey>& required_signers() const { return required_signers_; }

private:
    const std::string label_;
    const PublicKey payer_;
    const std::vector<Instruction> instructions_;
    const std::vector<PublicKey> required_signers_;
};

struct MessageHeader {
    uint8_t num_required_signatures = 0;
    uint8_t num_readonly_signed = 0;
    uint8_t num_readonly_unsigned = 0;
};

struct CompiledInstruction {
    uint8_t program_id_index = 0;
    std::vector<uint8_t> account_indices;
    std::vector<uint8_t> data;
};

// Legacy (unversioned) message
struct Message {
    MessageHeader header;
    std::vector<PublicKey> account_keys;
    Blockhash recent_blockhash;
    std::vector<CompiledInstruction> instructions;

    // Keys ordered payer first, then writable signers, readonly signers,
    // writable non-signers, readonly non-signers; flags merged per key.
    static Message compile(const std::vector<Instruction>& instructions, const PublicKey& payer,
                           const Blockhash& recent_blockhash);

    std::vector<uint8_t> serialize() const;
    std::vector<PublicKey> signer_keys() const;
    bool is_writable(size_t index) const;
};

struct SignedTransaction {
    std::vector<Signature> signatures;
    Message message;

    // Maximum size of a transaction on the wire
    static constexpr size_t PACKET_DATA_SIZE = 1232;

    std::vector<uint8_t> serialize() const;
    std::string to_base64() const;
    // base58 of the first (payer) signature; the transaction's identity
    std::string id() const;
};

namespace compute_budget {

Instruction set_compute_unit_limit(uint32_t units, const ProtocolConstants& c);
Instruction set_compute_unit_price(uint64_t micro_lamports, const ProtocolConstants& c);

// priority_fee_lamports spread over the unit limit, in micro-lamports per unit
uint64_t unit_price_for_fee(uint64_t priority_fee_lamports, uint32_t unit_limit);

} // namespace compute_budget

// Idempotent associated-token-account create; no-op when the account exists.
Instruction create_associated_token_account_idempotent(const PublicKey& payer, const PublicKey& ata,
                                                       const PublicKey& owner, const PublicKey& mint,
                                                       const ProtocolConstants& c);
