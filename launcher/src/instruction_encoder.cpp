#include "instruction_encoder.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <limits>

void ByteWriter::put_u8(uint8_t value) {
    data_.push_back(value);
}

void ByteWriter::put_u16(uint16_t value) {
    for (int i = 0; i < 2; ++i) {
        data_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void ByteWriter::put_u32(uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        data_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void ByteWriter::put_u64(uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        data_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void ByteWriter::put_bytes(const uint8_t* data, size_t size) {
    data_.insert(data_.end(), data, data + size);
}

void ByteWriter::put_bytes(const std::vector<uint8_t>& data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

void ByteWriter::put_key(const PublicKey& key) {
    put_bytes(key.bytes.data(), key.bytes.size());
}

void ByteWriter::put_string(const std::string& value) {
    if (value.size() > std::numeric_limits<uint32_t>::max()) {
        throw FieldTooLarge("String of " + std::to_string(value.size()) + " bytes exceeds u32 length prefix");
    }
    put_u32(static_cast<uint32_t>(value.size()));
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteWriter::put_compact_u16(size_t value) {
    if (value > std::numeric_limits<uint16_t>::max()) {
        throw FieldTooLarge("Length " + std::to_string(value) + " exceeds compact-u16");
    }
    // 7 bits per byte, high bit marks continuation
    while (true) {
        uint8_t byte = static_cast<uint8_t>(value & 0x7f);
        value >>= 7;
        if (value == 0) {
            put_u8(byte);
            return;
        }
        put_u8(byte | 0x80);
    }
}

void ByteReader::require(size_t size) const {
    if (remaining() < size) {
        throw DecodeError("Truncated payload: need " + std::to_string(size) +
                          " bytes, have " + std::to_string(remaining()));
    }
}

uint8_t ByteReader::get_u8() {
    require(1);
    return data_[offset_++];
}

uint32_t ByteReader::get_u32() {
    require(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data_[offset_++]) << (8 * i);
    }
    return value;
}

uint64_t ByteReader::get_u64() {
    require(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data_[offset_++]) << (8 * i);
    }
    return value;
}

std::vector<uint8_t> ByteReader::get_bytes(size_t size) {
    require(size);
    std::vector<uint8_t> out(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                             data_.begin() + static_cast<std::ptrdiff_t>(offset_ + size));
    offset_ += size;
    return out;
}

PublicKey ByteReader::get_key() {
    return PublicKey::from_bytes(get_bytes(PublicKey::SIZE));
}

std::string ByteReader::get_string() {
    uint32_t length = get_u32();
    auto raw = get_bytes(length);
    return std::string(raw.begin(), raw.end());
}

size_t ByteReader::get_compact_u16() {
    size_t value = 0;
    for (int shift = 0; shift < 21; shift += 7) {
        uint8_t byte = get_u8();
        value |= static_cast<size_t>(byte & 0x7f) << shift;
        if ((byte & 0x80) == 0) {
            if (value > std::numeric_limits<uint16_t>::max()) {
                throw DecodeError("compact-u16 overflow");
            }
            return value;
        }
    }
    throw DecodeError("compact-u16 longer than 3 bytes");
}

const char* to_string(InstructionKind kind) {
    switch (kind) {
        case InstructionKind::Create: return "create";
        case InstructionKind::Buy: return "buy";
        case InstructionKind::Sell: return "sell";
    }
    return "unknown";
}

namespace instruction_encoder {

namespace {

void expect_discriminator(ByteReader& reader, const std::array<uint8_t, 8>& expected, InstructionKind kind) {
    auto tag = reader.get_bytes(expected.size());
    if (!std::equal(tag.begin(), tag.end(), expected.begin())) {
        throw DecodeError(std::string("Payload is not a ") + to_string(kind) +
                          " instruction (discriminator " + util::to_hex(tag) + ")");
    }
}

void expect_consumed(const ByteReader& reader, InstructionKind kind) {
    if (reader.remaining() != 0) {
        throw DecodeError(std::string("Trailing bytes after ") + to_string(kind) + " payload: " +
                          std::to_string(reader.remaining()));
    }
}

} // namespace

std::vector<uint8_t> encode_create(const CreateArgs& args, const ProtocolConstants& c) {
    ByteWriter writer;
    writer.put_bytes(c.create_discriminator.data(), c.create_discriminator.size());
    writer.put_string(args.name);
    writer.put_string(args.symbol);
    writer.put_string(args.uri);
    writer.put_key(args.creator);
    return writer.release();
}

std::vector<uint8_t> encode_buy(const BuyArgs& args, const ProtocolConstants& c) {
    ByteWriter writer;
    writer.put_bytes(c.buy_discriminator.data(), c.buy_discriminator.size());
    writer.put_u64(args.amount);
    writer.put_u64(args.max_sol_cost);
    return writer.release();
}

std::vector<uint8_t> encode_sell(const SellArgs& args, const ProtocolConstants& c) {
    ByteWriter writer;
    writer.put_bytes(c.sell_discriminator.data(), c.sell_discriminator.size());
    writer.put_u64(args.amount);
    writer.put_u64(args.min_sol_output);
    return writer.release();
}

InstructionKind kind_of(const std::vector<uint8_t>& data, const ProtocolConstants& c) {
    if (data.size() < 8) {
        throw DecodeError("Payload shorter than a discriminator");
    }
    if (std::equal(c.create_discriminator.begin(), c.create_discriminator.end(), data.begin())) {
        return InstructionKind::Create;
    }
    if (std::equal(c.buy_discriminator.begin(), c.buy_discriminator.end(), data.begin())) {
        return InstructionKind::Buy;
    }
    if (std::equal(c.sell_discriminator.begin(), c.sell_discriminator.end(), data.begin())) {
        return InstructionKind::Sell;
    }
    throw DecodeError("Unknown discriminator " + util::to_hex({data.begin(), data.begin() + 8}));
}

CreateArgs decode_create(const std::vector<uint8_t>& data, const ProtocolConstants& c) {
    ByteReader reader(data);
    expect_discriminator(reader, c.create_discriminator, InstructionKind::Create);
    CreateArgs args;
    args.name = reader.get_string();
    args.symbol = reader.get_string();
    args.uri = reader.get_string();
    args.creator = reader.get_key();
    expect_consumed(reader, InstructionKind::Create);
    return args;
}

BuyArgs decode_buy(const std::vector<uint8_t>& data, const ProtocolConstants& c) {
    ByteReader reader(data);
    expect_discriminator(reader, c.buy_discriminator, InstructionKind::Buy);
    BuyArgs args;
    args.amount = reader.get_u64();
    args.max_sol_cost = reader.get_u64();
    expect_consumed(reader, InstructionKind::Buy);
    return args;
}

SellArgs decode_sell(const std::vector<uint8_t>& data, const ProtocolConstants& c) {
    ByteReader reader(data);
    expect_discriminator(reader, c.sell_discriminator, InstructionKind::Sell);
    SellArgs args;
    args.amount = reader.get_u64();
    args.min_sol_output = reader.get_u64();
    expect_consumed(reader, InstructionKind::Sell);
    return args;
}

} // namespace instruction_encoder
