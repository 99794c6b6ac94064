// ============================================================
// crypto.cpp -- Key derivation and AES-256-GCM primitives
// ============================================================

#include "crypto.hpp"
#include "errors.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <algorithm>
#include <climits>

namespace crypto {

static std::string openssl_error() {
    unsigned long e = ERR_get_error();
    if (e == 0) return "unknown OpenSSL error";
    char buf[256] = {0};
    ERR_error_string_n(e, buf, sizeof(buf));
    return buf;
}

Key derive_key(const std::string& tag, const std::string& passphrase) {
    u8 digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (!HMAC(EVP_sha512_256(),
              tag.data(), (int)tag.size(),
              reinterpret_cast<const u8*>(passphrase.data()), passphrase.size(),
              digest, &digest_len) || digest_len < KEY_SIZE) {
        throw CodecError(CodecErrc::CIPHER_INIT, "HMAC-SHA-512/256: " + openssl_error());
    }

    Key key;
    std::copy(digest, digest + KEY_SIZE, key.begin());
    OPENSSL_cleanse(digest, sizeof(digest));
    return key;
}

void random_bytes(u8* out, size_t len) {
    if (len > (size_t)INT_MAX || RAND_bytes(out, (int)len) != 1) {
        throw CodecError(CodecErrc::NONCE_GENERATION, openssl_error());
    }
}

AesGcm::AesGcm(const Key& key) {
    enc_ = EVP_CIPHER_CTX_new();
    dec_ = EVP_CIPHER_CTX_new();
    bool ok = enc_ && dec_;

    // Bind cipher, IV length and key once; each frame only sets the nonce
    ok = ok && EVP_EncryptInit_ex(enc_, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(enc_, EVP_CTRL_GCM_SET_IVLEN, (int)NONCE_SIZE, nullptr) == 1;
    ok = ok && EVP_EncryptInit_ex(enc_, nullptr, nullptr, key.data(), nullptr) == 1;

    ok = ok && EVP_DecryptInit_ex(dec_, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(dec_, EVP_CTRL_GCM_SET_IVLEN, (int)NONCE_SIZE, nullptr) == 1;
    ok = ok && EVP_DecryptInit_ex(dec_, nullptr, nullptr, key.data(), nullptr) == 1;

    if (!ok) {
        std::string err = openssl_error();
        EVP_CIPHER_CTX_free(enc_);
        EVP_CIPHER_CTX_free(dec_);
        enc_ = dec_ = nullptr;
        throw CodecError(CodecErrc::CIPHER_INIT, "AES-256-GCM: " + err);
    }
}

AesGcm::~AesGcm() {
    EVP_CIPHER_CTX_free(enc_);
    EVP_CIPHER_CTX_free(dec_);
}

void AesGcm::seal(const u8 nonce[NONCE_SIZE], const u8* pt, size_t len, u8* out) {
    int outl = 0, tmplen = 0;
    bool ok = len <= (size_t)INT_MAX;
    ok = ok && EVP_EncryptInit_ex(enc_, nullptr, nullptr, nullptr, nonce) == 1;
    ok = ok && EVP_EncryptUpdate(enc_, out, &outl, pt, (int)len) == 1;
    ok = ok && EVP_EncryptFinal_ex(enc_, out + outl, &tmplen) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(enc_, EVP_CTRL_GCM_GET_TAG, (int)TAG_SIZE, out + len) == 1;
    if (!ok || (size_t)(outl + tmplen) != len) {
        throw CodecError(CodecErrc::CIPHER_INIT, "AES-256-GCM seal: " + openssl_error());
    }
}

bool AesGcm::open(const u8 nonce[NONCE_SIZE], const u8* in, size_t len, u8* pt) {
    int outl = 0, tmplen = 0;
    if (len > (size_t)INT_MAX) return false;
    if (EVP_DecryptInit_ex(dec_, nullptr, nullptr, nullptr, nonce) != 1) {
        throw CodecError(CodecErrc::CIPHER_INIT, "AES-256-GCM open: " + openssl_error());
    }
    if (EVP_DecryptUpdate(dec_, pt, &outl, in, (int)len) != 1) return false;
    if (EVP_CIPHER_CTX_ctrl(dec_, EVP_CTRL_GCM_SET_TAG, (int)TAG_SIZE,
                            const_cast<u8*>(in + len)) != 1) return false;
    return EVP_DecryptFinal_ex(dec_, pt + outl, &tmplen) == 1;
}

} // namespace crypto
