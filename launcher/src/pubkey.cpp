#include "pubkey.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>

PublicKey PublicKey::from_base58(const std::string& text) {
    auto raw = util::base58_decode(text);
    if (raw.size() != SIZE) {
        throw DecodeError("Invalid public key length for " + text);
    }
    return from_bytes(raw);
}

PublicKey PublicKey::from_bytes(const std::vector<uint8_t>& raw) {
    if (raw.size() != SIZE) {
        throw DecodeError("Public key must be 32 bytes, got " + std::to_string(raw.size()));
    }
    PublicKey key;
    std::copy(raw.begin(), raw.end(), key.bytes.begin());
    return key;
}

std::string PublicKey::to_base58() const {
    return util::base58_encode(to_vector());
}

class Keypair::Impl {
public:
    explicit Impl(EVP_PKEY* pkey) : pkey_(pkey) {}

    ~Impl() {
        if (pkey_) {
            EVP_PKEY_free(pkey_);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    PublicKey public_key() const {
        std::array<uint8_t, PublicKey::SIZE> raw{};
        size_t len = raw.size();
        if (EVP_PKEY_get_raw_public_key(pkey_, raw.data(), &len) != 1 || len != raw.size()) {
            throw std::runtime_error("Failed to extract Ed25519 public key");
        }
        return PublicKey(raw);
    }

    Signature sign(const std::vector<uint8_t>& message) const {
        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }

        Signature sig{};
        size_t sig_len = sig.size();
        bool ok = EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, pkey_) == 1 &&
                  EVP_DigestSign(ctx, sig.data(), &sig_len, message.data(), message.size()) == 1 &&
                  sig_len == sig.size();
        EVP_MD_CTX_free(ctx);

        if (!ok) {
            throw std::runtime_error("Ed25519 signing failed");
        }
        return sig;
    }

private:
    EVP_PKEY* pkey_;
};

Keypair::Keypair() = default;
Keypair::~Keypair() = default;
Keypair::Keypair(Keypair&&) noexcept = default;
Keypair& Keypair::operator=(Keypair&&) noexcept = default;

Keypair Keypair::generate() {
    std::vector<uint8_t> seed(32);
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    Keypair keypair = from_seed(seed);
    std::fill(seed.begin(), seed.end(), 0);
    return keypair;
}

Keypair Keypair::from_seed(const std::vector<uint8_t>& seed) {
    if (seed.size() != 32) {
        throw ValidationError("Ed25519 seed must be 32 bytes");
    }
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size());
    if (!pkey) {
        throw std::runtime_error("Failed to load Ed25519 private key");
    }

    Keypair keypair;
    keypair.pImpl_ = std::make_unique<Impl>(pkey);
    keypair.public_key_ = keypair.pImpl_->public_key();
    return keypair;
}

Keypair Keypair::from_secret(const std::vector<uint8_t>& secret) {
    if (secret.size() != 64) {
        throw ValidationError("Secret key must be 64 bytes, got " + std::to_string(secret.size()));
    }
    Keypair keypair = from_seed(std::vector<uint8_t>(secret.begin(), secret.begin() + 32));
    if (!std::equal(secret.begin() + 32, secret.end(), keypair.public_key_.bytes.begin())) {
        throw ValidationError("Secret key public half does not match its seed");
    }
    return keypair;
}

Keypair Keypair::from_encoded(const std::string& encoded) {
    std::string text = util::trim(encoded);

    // base58 is the wallet export format; base64 is accepted for raw dumps
    static const std::string base58_chars =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
    bool looks_base58 = !text.empty() && text.find_first_not_of(base58_chars) == std::string::npos;

    std::vector<uint8_t> raw;
    if (looks_base58) {
        raw = util::base58_decode(text);
    }
    if (raw.size() != 64) {
        try {
            raw = util::base64_decode(text);
        } catch (const DecodeError& e) {
            throw ValidationError(std::string("Private key is neither base58 nor base64: ") + e.what());
        }
    }
    if (raw.size() != 64) {
        throw ValidationError("Private key does not decode to a 64-byte secret");
    }
    return from_secret(raw);
}

Signature Keypair::sign(const std::vector<uint8_t>& message) const {
    return pImpl_->sign(message);
}
