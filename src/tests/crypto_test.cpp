#include <gtest/gtest.h>
#include <set>
#include "crypto/crypto_error.hpp"
#include "crypto/feistel_permutation.hpp"
#include "crypto/hash.hpp"
#include "crypto/key_pair.hpp"
#include "crypto/keystream_cipher.hpp"
#include "test_utils.hpp"

using namespace pous::crypto;

class CryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging();
    }
};

TEST_F(CryptoTest, Sha256KnownAnswer) {
    const std::string abc = "abc";
    EXPECT_EQ(to_hex(sha256(abc.data(), abc.size())),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(to_hex(sha256(Bytes{})),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(CryptoTest, HasherIsReusableAfterFinalize) {
    Hasher hasher;
    Digest first = hasher.update(std::string("ab")).update(std::string("c")).finalize();
    Digest second = hasher.update(std::string("abc")).finalize();
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, sha256(to_bytes("abc")));
}

TEST_F(CryptoTest, HexConversion) {
    Bytes data = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(to_hex(data), "000fa5ff");
    EXPECT_EQ(from_hex("000fa5ff"), data);
    EXPECT_EQ(from_hex("000FA5FF"), data);
    EXPECT_THROW(from_hex("abc"), CryptoError);
    EXPECT_THROW(from_hex("zz"), CryptoError);
}

TEST_F(CryptoTest, RandomBytes) {
    EXPECT_EQ(random_bytes(32).size(), 32u);
    EXPECT_NE(random_bytes(32), random_bytes(32));
}

TEST_F(CryptoTest, SignAndVerify) {
    KeyPair key = KeyPair::generate();
    Bytes message = to_bytes("bound chunk");
    Signature signature = key.sign(message);

    EXPECT_TRUE(verify_signature(key.public_key(), message, signature));
    EXPECT_NO_THROW(require_valid_signature(key.public_key(), message, signature, "test"));

    Bytes tampered = message;
    tampered[0] ^= 0x01;
    EXPECT_FALSE(verify_signature(key.public_key(), tampered, signature));
    EXPECT_THROW(require_valid_signature(key.public_key(), tampered, signature, "test"), SignatureInvalidError);

    KeyPair other = KeyPair::generate();
    EXPECT_FALSE(verify_signature(other.public_key(), message, signature));
}

TEST_F(CryptoTest, SignaturesAreDeterministic) {
    KeyPair key = KeyPair::generate();
    Bytes message = to_bytes("same input");
    EXPECT_EQ(key.sign(message), key.sign(message));
}

TEST_F(CryptoTest, KeyPairPersistence) {
    TempDir dir("key_test");
    KeyPair key = KeyPair::generate();
    key.save(dir.path() / "node.key");

    KeyPair loaded = KeyPair::load(dir.path() / "node.key");
    EXPECT_EQ(loaded.public_key(), key.public_key());

    KeyPair rebuilt = KeyPair::from_private_key(key.private_key_bytes());
    EXPECT_EQ(rebuilt.public_key(), key.public_key());

    EXPECT_THROW(KeyPair::from_private_key(Bytes(5, 0x01)), KeyError);
    EXPECT_THROW(KeyPair::load(dir.path() / "missing.key"), CryptoError);
}

TEST_F(CryptoTest, KeystreamIsItsOwnInverse) {
    Digest key{};
    key.fill(0x42);
    KeystreamCipher::Iv iv{};
    iv.fill(0x24);
    Bytes plaintext = pattern_bytes(1000);

    KeystreamCipher encrypt;
    encrypt.initialize(key, iv);
    Bytes ciphertext = encrypt.apply(plaintext);
    EXPECT_NE(ciphertext, plaintext);
    EXPECT_EQ(ciphertext.size(), plaintext.size());

    KeystreamCipher decrypt;
    decrypt.initialize(key, iv);
    EXPECT_EQ(decrypt.apply(ciphertext), plaintext);
}

TEST_F(CryptoTest, KeystreamRequiresInitialization) {
    KeystreamCipher cipher;
    Bytes data = to_bytes("data");
    EXPECT_THROW(cipher.apply_in_place(data), CipherError);
}

TEST_F(CryptoTest, FeistelPermutationIsABijection) {
    const FeistelPermutation::RoundKeys keys = {11, 22, 33, 44};
    for (uint64_t size : {1ull, 2ull, 7ull, 10ull, 64ull, 1000ull}) {
        FeistelPermutation permutation(size, keys);
        std::set<uint64_t> images;
        for (uint64_t i = 0; i < size; ++i) {
            uint64_t image = permutation.permute(i);
            ASSERT_LT(image, size);
            images.insert(image);
            EXPECT_EQ(permutation.invert(image), i);
        }
        EXPECT_EQ(images.size(), size);
    }
}

TEST_F(CryptoTest, FeistelPermutationDependsOnKeys) {
    FeistelPermutation a(1000, {1, 2, 3, 4});
    FeistelPermutation b(1000, {1, 2, 3, 5});
    size_t differing = 0;
    for (uint64_t i = 0; i < 1000; ++i) {
        differing += a.permute(i) != b.permute(i) ? 1 : 0;
    }
    EXPECT_GT(differing, 500u);
}

TEST_F(CryptoTest, FeistelPermutationRejectsBadInput) {
    EXPECT_THROW(FeistelPermutation(0, {1, 2, 3, 4}), CryptoError);
    FeistelPermutation permutation(10, {1, 2, 3, 4});
    EXPECT_THROW(permutation.permute(10), CryptoError);
    EXPECT_THROW(permutation.invert(10), CryptoError);
}
