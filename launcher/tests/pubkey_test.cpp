#include "pubkey.hpp"
#include "errors.hpp"
#include "fakes.hpp"
#include "util.hpp"
#include <gtest/gtest.h>

namespace {

const char* TEST_SECRET_BASE58 =
    "1GMkH3brNXiNNs1tiFZHu4yZSRrzJwxi5wB9bHFtMikjwpAW9DMZzU2Pqakc5it8X3N5vPmqdN7KF4CCUpmKhq";
const char* TEST_SECRET_BASE64 =
    "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8DoQe/884Qvh1w3RjnS8CZZ+TWMJulDV8d3IZkElUxuA==";

std::string hex_of(const Signature& sig) {
    return util::to_hex({sig.begin(), sig.end()});
}

} // namespace

TEST(PublicKeyTest, Base58RoundTripsLeadingZeros) {
    PublicKey zero;
    EXPECT_EQ(zero.to_base58(), "11111111111111111111111111111111");
    EXPECT_EQ(PublicKey::from_base58("11111111111111111111111111111111"), zero);
}

TEST(PublicKeyTest, ConstantsDecode) {
    auto key = PublicKey::from_base58("6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P");
    EXPECT_EQ(key.to_base58(), "6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P");
}

TEST(PublicKeyTest, RejectsBadInput) {
    EXPECT_THROW(PublicKey::from_base58("0OIl"), DecodeError);
    EXPECT_THROW(PublicKey::from_base58("abc"), DecodeError);
    EXPECT_THROW(PublicKey::from_bytes(std::vector<uint8_t>(31, 1)), DecodeError);
}

TEST(KeypairTest, Rfc8032TestVectorOne) {
    auto kp = Keypair::from_seed(util::from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"));
    EXPECT_EQ(util::to_hex(kp.public_key().to_vector()),
              "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
    EXPECT_EQ(hex_of(kp.sign({})),
              "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065"
              "224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
}

TEST(KeypairTest, SigningIsDeterministic) {
    auto kp = Keypair::from_seed(counting_bytes(0, 32));
    std::vector<uint8_t> message = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(util::to_hex(kp.public_key().to_vector()),
              "03a107bff3ce10be1d70dd18e74bc09967e4d6309ba50d5f1ddc8664125531b8");
    EXPECT_EQ(hex_of(kp.sign(message)),
              "e1a7fca94a835127885b99e2eba733d6ee5bf5dc463ed8385eb6f1dcaa1117c0"
              "f151750a10f46f5b3796a91203578f702c85c67c334b5689a516284d499f710f");
    EXPECT_EQ(kp.sign(message), kp.sign(message));
}

TEST(KeypairTest, FromEncodedAcceptsBase58AndBase64) {
    auto from58 = Keypair::from_encoded(TEST_SECRET_BASE58);
    auto from64 = Keypair::from_encoded(TEST_SECRET_BASE64);
    EXPECT_EQ(from58.public_key().to_base58(), "FAe4sisG95oZ42w7buUn5qEE4TAnfTTFPiguZUHmhiF");
    EXPECT_EQ(from58.public_key(), from64.public_key());
}

TEST(KeypairTest, SecretWithWrongPublicHalfIsRejected) {
    auto secret = counting_bytes(0, 64);
    EXPECT_THROW(Keypair::from_secret(secret), ValidationError);
    EXPECT_THROW(Keypair::from_secret(counting_bytes(0, 32)), ValidationError);
}

TEST(KeypairTest, GarbageEncodingIsRejected) {
    EXPECT_THROW(Keypair::from_encoded("not a key!"), ValidationError);
}

TEST(KeypairTest, GeneratedKeysDiffer) {
    auto a = Keypair::generate();
    auto b = Keypair::generate();
    EXPECT_NE(a.public_key(), b.public_key());
}

TEST(KeypairTest, MovedKeypairStillSigns) {
    auto original = Keypair::from_seed(counting_bytes(0, 32));
    auto expected = original.sign({1, 2, 3});
    Keypair moved = std::move(original);
    EXPECT_EQ(moved.sign({1, 2, 3}), expected);
}
