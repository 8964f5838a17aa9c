#pragma once
#include "constants.hpp"
#include "pubkey.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Little-endian writer for instruction and message payloads
class ByteWriter {
public:
    void put_u8(uint8_t value);
    void put_u16(uint16_t value);
    void put_u32(uint32_t value);
    void put_u64(uint64_t value);
    void put_bytes(const uint8_t* data, size_t size);
    void put_bytes(const std::vector<uint8_t>& data);
    void put_key(const PublicKey& key);
    // 4-byte length prefix + raw UTF-8; FieldTooLarge past u32
    void put_string(const std::string& value);
    // Solana short-vec length; FieldTooLarge past u16
    void put_compact_u16(size_t value);

    const std::vector<uint8_t>& data() const { return data_; }
    std::vector<uint8_t> release() { return std::move(data_); }

private:
    std::vector<uint8_t> data_;
};

// Reader counterpart; every getter throws DecodeError on truncation.
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data) : data_(data) {}

    uint8_t get_u8();
    uint32_t get_u32();
    uint64_t get_u64();
    std::vector<uint8_t> get_bytes(size_t size);
    PublicKey get_key();
    std::string get_string();
    size_t get_compact_u16();

    size_t remaining() const { return data_.size() - offset_; }

private:
    void require(size_t size) const;

    const std::vector<uint8_t>& data_;
    size_t offset_ = 0;
};

enum class InstructionKind { Create, Buy, Sell };

const char* to_string(InstructionKind kind);

struct CreateArgs {
    std::string name;
    std::string symbol;
    std::string uri;
    PublicKey creator;

    bool operator==(const CreateArgs& o) const {
        return name == o.name && symbol == o.symbol && uri == o.uri && creator == o.creator;
    }
};

struct BuyArgs {
    uint64_t amount = 0;        // tokens requested
    uint64_t max_sol_cost = 0;  // lamports

    bool operator==(const BuyArgs& o) const { return amount == o.amount && max_sol_cost == o.max_sol_cost; }
};

struct SellArgs {
    uint64_t amount = 0;          // tokens disposed of
    uint64_t min_sol_output = 0;  // lamports

    bool operator==(const SellArgs& o) const { return amount == o.amount && min_sol_output == o.min_sol_output; }
};

namespace instruction_encoder {

std::vector<uint8_t> encode_create(const CreateArgs& args, const ProtocolConstants& c);
std::vector<uint8_t> encode_buy(const BuyArgs& args, const ProtocolConstants& c);
std::vector<uint8_t> encode_sell(const SellArgs& args, const ProtocolConstants& c);

// Identifies the payload by its 8-byte discriminator
InstructionKind kind_of(const std::vector<uint8_t>& data, const ProtocolConstants& c);

// Inverse of the encoders; reject a foreign discriminator or trailing bytes
CreateArgs decode_create(const std::vector<uint8_t>& data, const ProtocolConstants& c);
BuyArgs decode_buy(const std::vector<uint8_t>& data, const ProtocolConstants& c);
SellArgs decode_sell(const std::vector<uint8_t>& data, const ProtocolConstants& c);

} // namespace instruction_encoder
