#include <gtest/gtest.h>
#include "../common/crypto.hpp"
#include "../common/errors.hpp"
#include <cstring>
#include <string>
#include <vector>

static std::string to_hex(const crypto::Key& k) {
    static const char* digits = "0123456789abcdef";
    std::string s;
    for (u8 b : k) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0xF]);
    }
    return s;
}

//=============================================================================
// Key derivation
//=============================================================================

TEST(KeyDerivationTest, MatchesHmacSha512_256) {
    crypto::Key k = crypto::derive_key("treepipe stream key v1", "correct horse");
    EXPECT_EQ(to_hex(k), "7e9e71a33764ba605031cc2058fa496b94d9f8861d6520f3fe2c80128c5d6bf4");
}

TEST(KeyDerivationTest, Deterministic) {
    EXPECT_EQ(crypto::derive_key("tag", "secret"), crypto::derive_key("tag", "secret"));
}

TEST(KeyDerivationTest, PassphraseAndTagBothMatter) {
    crypto::Key base = crypto::derive_key("tag", "secret");
    EXPECT_NE(base, crypto::derive_key("tag", "secret2"));
    EXPECT_NE(base, crypto::derive_key("tag2", "secret"));
}

TEST(KeyDerivationTest, DomainTagIsFixed) {
    EXPECT_STREQ(crypto::KEY_DOMAIN_TAG, "treepipe stream key v1");
}

//=============================================================================
// AES-GCM primitive
//=============================================================================

TEST(AesGcmTest, SealOpen) {
    crypto::Key key = crypto::derive_key("t", "p");
    crypto::AesGcm aead(key);

    u8 nonce[crypto::NONCE_SIZE];
    crypto::random_bytes(nonce, sizeof(nonce));

    std::string msg = "attack at dawn";
    std::vector<u8> sealed(msg.size() + crypto::TAG_SIZE);
    aead.seal(nonce, reinterpret_cast<const u8*>(msg.data()), msg.size(), sealed.data());
    EXPECT_NE(std::memcmp(sealed.data(), msg.data(), msg.size()), 0);

    std::vector<u8> opened(msg.size());
    ASSERT_TRUE(aead.open(nonce, sealed.data(), msg.size(), opened.data()));
    EXPECT_EQ(std::string(opened.begin(), opened.end()), msg);
}

TEST(AesGcmTest, TamperedTagRejected) {
    crypto::AesGcm aead(crypto::derive_key("t", "p"));
    u8 nonce[crypto::NONCE_SIZE] = {0};
    u8 pt[4] = {1, 2, 3, 4};
    u8 sealed[4 + crypto::TAG_SIZE];
    aead.seal(nonce, pt, 4, sealed);
    sealed[4 + 3] ^= 0x01;

    u8 out[4];
    EXPECT_FALSE(aead.open(nonce, sealed, 4, out));
}

TEST(AesGcmTest, WrongKeyRejected) {
    crypto::AesGcm a(crypto::derive_key("t", "one"));
    crypto::AesGcm b(crypto::derive_key("t", "two"));
    u8 nonce[crypto::NONCE_SIZE] = {0};
    u8 pt[8] = {0};
    u8 sealed[8 + crypto::TAG_SIZE];
    a.seal(nonce, pt, 8, sealed);

    u8 out[8];
    EXPECT_FALSE(b.open(nonce, sealed, 8, out));
}

TEST(AesGcmTest, EmptyPlaintext) {
    crypto::AesGcm aead(crypto::derive_key("t", "p"));
    u8 nonce[crypto::NONCE_SIZE] = {7};
    u8 sealed[crypto::TAG_SIZE];
    aead.seal(nonce, nullptr, 0, sealed);
    EXPECT_TRUE(aead.open(nonce, sealed, 0, nullptr));
}
