#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct PublicKey {
    static constexpr size_t SIZE = 32;
    std::array<uint8_t, SIZE> bytes{};

    PublicKey() = default;
    explicit PublicKey(const std::array<uint8_t, SIZE>& raw) : bytes(raw) {}

    static PublicKey from_base58(const std::string& text);
    static PublicKey from_bytes(const std::vector<uint8_t>& raw);

    std::string to_base58() const;
    std::vector<uint8_t> to_vector() const { return {bytes.begin(), bytes.end()}; }

    bool operator==(const PublicKey& other) const { return bytes == other.bytes; }
    bool operator!=(const PublicKey& other) const { return bytes != other.bytes; }
    bool operator<(const PublicKey& other) const { return bytes < other.bytes; }
};

using Signature = std::array<uint8_t, 64>;

// Ed25519 signing key. Move-only; the secret never leaves the object.
class Keypair {
public:
    static Keypair generate();
    static Keypair from_seed(const std::vector<uint8_t>& seed);
    // 64 bytes: seed followed by the public key
    static Keypair from_secret(const std::vector<uint8_t>& secret);
    // base58 or base64 encoding of the 64-byte secret
    static Keypair from_encoded(const std::string& encoded);

    ~Keypair();
    Keypair(Keypair&&) noexcept;
    Keypair& operator=(Keypair&&) noexcept;
    Keypair(const Keypair&) = delete;
    Keypair& operator=(const Keypair&) = delete;

    const PublicKey& public_key() const { return public_key_; }
    Signature sign(const std::vector<uint8_t>& message) const;

private:
    Keypair();

    class Impl;
    std::unique_ptr<Impl> pImpl_;
    PublicKey public_key_;
};
