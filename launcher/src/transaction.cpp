#include "transaction.hpp"
#include "errors.hpp"
#include "instruction_encoder.hpp"
#include "util.hpp"
#include <algorithm>
#include <limits>
#include <string>

TransactionPlan::TransactionPlan(std::string label, PublicKey payer, std::vector<Instruction> instructions,
                                 std::vector<PublicKey> required_signers)
    : label_(std::move(label)),
      payer_(payer),
      instructions_(std::move(instructions)),
      required_signers_(std::move(required_signers)) {
}

namespace {

struct KeyEntry {
    PublicKey key;
    bool signer = false;
    bool writable = false;
};

void merge_key(std::vector<KeyEntry>& entries, const PublicKey& key, bool signer, bool writable) {
    for (auto& e : entries) {
        if (e.key == key) {
            e.signer = e.signer || signer;
            e.writable = e.writable || writable;
            return;
        }
    }
    entries.push_back({key, signer, writable});
}

int group_of(const KeyEntry& e) {
    if (e.signer) {
        return e.writable ? 0 : 1;
    }
    return e.writable ? 2 : 3;
}

uint8_t index_of(const std::vector<PublicKey>& keys, const PublicKey& key) {
    auto it = std::find(keys.begin(), keys.end(), key);
    return static_cast<uint8_t>(it - keys.begin());
}

} // namespace

Message Message::compile(const std::vector<Instruction>& instructions, const PublicKey& payer,
                         const Blockhash& recent_blockhash) {
    std::vector<KeyEntry> entries;
    merge_key(entries, payer, true, true);
    for (const auto& ix : instructions) {
        for (const auto& meta : ix.accounts) {
            merge_key(entries, meta.pubkey, meta.is_signer, meta.is_writable);
        }
        merge_key(entries, ix.program_id, false, false);
    }

    if (entries.size() > std::numeric_limits<uint8_t>::max() + 1u) {
        throw FieldTooLarge("Transaction references " + std::to_string(entries.size()) + " accounts");
    }

    // The payer is a writable signer seen first, so a stable sort keeps it at index 0
    std::stable_sort(entries.begin(), entries.end(),
                     [](const KeyEntry& a, const KeyEntry& b) { return group_of(a) < group_of(b); });

    Message message;
    message.recent_blockhash = recent_blockhash;
    for (const auto& e : entries) {
        message.account_keys.push_back(e.key);
        if (e.signer) {
            message.header.num_required_signatures++;
            if (!e.writable) {
                message.header.num_readonly_signed++;
            }
        } else if (!e.writable) {
            message.header.num_readonly_unsigned++;
        }
    }

    for (const auto& ix : instructions) {
        CompiledInstruction compiled;
        compiled.program_id_index = index_of(message.account_keys, ix.program_id);
        for (const auto& meta : ix.accounts) {
            compiled.account_indices.push_back(index_of(message.account_keys, meta.pubkey));
        }
        compiled.data = ix.data;
        message.instructions.push_back(std::move(compiled));
    }
    return message;
}

std::vector<uint8_t> Message::serialize() const {
    ByteWriter writer;
    writer.put_u8(header.num_required_signatures);
    writer.put_u8(header.num_readonly_signed);
    writer.put_u8(header.num_readonly_unsigned);

    writer.put_compact_u16(account_keys.size());
    for (const auto& key : account_keys) {
        writer.put_key(key);
    }
    writer.put_key(recent_blockhash);

    writer.put_compact_u16(instructions.size());
    for (const auto& ix : instructions) {
        writer.put_u8(ix.program_id_index);
        writer.put_compact_u16(ix.account_indices.size());
        writer.put_bytes(ix.account_indices);
        writer.put_compact_u16(ix.data.size());
        writer.put_bytes(ix.data);
    }
    return writer.release();
}

std::vector<PublicKey> Message::signer_keys() const {
    return {account_keys.begin(), account_keys.begin() + header.num_required_signatures};
}

bool Message::is_writable(size_t index) const {
    size_t signers = header.num_required_signatures;
    if (index < signers) {
        return index < signers - header.num_readonly_signed;
    }
    return index < account_keys.size() - header.num_readonly_unsigned;
}

std::vector<uint8_t> SignedTransaction::serialize() const {
    ByteWriter writer;
    writer.put_compact_u16(signatures.size());
    for (const auto& sig : signatures) {
        writer.put_bytes(sig.data(), sig.size());
    }
    writer.put_bytes(message.serialize());

    if (writer.data().size() > PACKET_DATA_SIZE) {
        throw FieldTooLarge("Transaction is " + std::to_string(writer.data().size()) +
                            " bytes, limit " + std::to_string(PACKET_DATA_SIZE));
    }
    return writer.release();
}

std::string SignedTransaction::to_base64() const {
    return util::base64_encode(serialize());
}

std::string SignedTransaction::id() const {
    if (signatures.empty()) {
        throw EncodingError("Transaction carries no signatures");
    }
    return util::base58_encode({signatures.front().begin(), signatures.front().end()});
}

namespace compute_budget {

namespace {
constexpr uint8_t SET_COMPUTE_UNIT_LIMIT = 2;
constexpr uint8_t SET_COMPUTE_UNIT_PRICE = 3;
constexpr uint64_t MICRO_LAMPORTS_PER_LAMPORT = 1000000;
}

Instruction set_compute_unit_limit(uint32_t units, const ProtocolConstants& c) {
    ByteWriter writer;
    writer.put_u8(SET_COMPUTE_UNIT_LIMIT);
    writer.put_u32(units);
    return {c.compute_budget_program, {}, writer.release()};
}

Instruction set_compute_unit_price(uint64_t micro_lamports, const ProtocolConstants& c) {
    ByteWriter writer;
    writer.put_u8(SET_COMPUTE_UNIT_PRICE);
    writer.put_u64(micro_lamports);
    return {c.compute_budget_program, {}, writer.release()};
}

uint64_t unit_price_for_fee(uint64_t priority_fee_lamports, uint32_t unit_limit) {
    if (unit_limit == 0) {
        throw ValidationError("Compute unit limit must be positive");
    }
    if (priority_fee_lamports > std::numeric_limits<uint64_t>::max() / MICRO_LAMPORTS_PER_LAMPORT) {
        throw FieldTooLarge("Priority fee of " + std::to_string(priority_fee_lamports) +
                            " lamports overflows the micro-lamport price");
    }
    return priority_fee_lamports * MICRO_LAMPORTS_PER_LAMPORT / unit_limit;
}

} // namespace compute_budget

Instruction create_associated_token_account_idempotent(const PublicKey& payer, const PublicKey& ata,
                                                       const PublicKey& owner, const PublicKey& mint,
                                                       const ProtocolConstants& c) {
    return {c.associated_token_program,
            {
                AccountMeta::writable(payer, true),
                AccountMeta::writable(ata),
                AccountMeta::readonly(owner),
                AccountMeta::readonly(mint),
                AccountMeta::readonly(c.system_program),
                AccountMeta::readonly(c.token_program),
            },
            {1}};
}
