#pragma once

// ============================================================
// crypto.hpp -- Key derivation and AES-256-GCM primitives
// ============================================================

#include "platform.hpp"
#include <array>
#include <string>

#include <openssl/evp.h>

namespace crypto {

static constexpr size_t KEY_SIZE   = 32;   // AES-256
static constexpr size_t NONCE_SIZE = 12;   // GCM standard
static constexpr size_t TAG_SIZE   = 16;   // GCM tag

// Domain tag the programs derive stream keys under
static constexpr const char* KEY_DOMAIN_TAG = "treepipe stream key v1";

using Key = std::array<u8, KEY_SIZE>;

// HMAC-SHA-512/256(key = tag, data = passphrase), truncated to 32 bytes.
// Deterministic: both ends derive the same key from the same passphrase.
// No salt, no stretching.
Key derive_key(const std::string& tag, const std::string& passphrase);

// Fill out with CSPRNG bytes. Throws CodecError(NONCE_GENERATION).
void random_bytes(u8* out, size_t len);

// AES-256-GCM with the key bound once; nonce supplied per call.
// Not thread-safe: one instance per stream.
class AesGcm {
public:
    // Throws CodecError(CIPHER_INIT)
    explicit AesGcm(const Key& key);
    ~AesGcm();

    AesGcm(const AesGcm&) = delete;
    AesGcm& operator=(const AesGcm&) = delete;

    // out receives len ciphertext bytes followed by TAG_SIZE tag bytes
    void seal(const u8 nonce[NONCE_SIZE], const u8* pt, size_t len, u8* out);

    // in holds len ciphertext bytes followed by TAG_SIZE tag bytes.
    // Returns false when the tag does not verify; pt is then garbage.
    bool open(const u8 nonce[NONCE_SIZE], const u8* in, size_t len, u8* pt);

private:
    EVP_CIPHER_CTX* enc_{nullptr};
    EVP_CIPHER_CTX* dec_{nullptr};
};

} // namespace crypto
