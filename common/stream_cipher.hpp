#pragma once

// ============================================================
// stream_cipher.hpp -- Chunked AES-256-GCM stream codec
//
// Wire format, one frame per flushed chunk:
//
//   [u64 big-endian length][nonce 12][ciphertext][tag 16]
//
// length counts nonce + ciphertext + tag. Every frame carries a
// fresh random nonce. No associated data.
//
// Both ends are single-use state machines: ACTIVE until the
// first failure (FAILED, every later call rethrows the stored
// error without touching I/O) or close() (CLOSED).
// ============================================================

#include "platform.hpp"
#include "stream.hpp"
#include "crypto.hpp"
#include <exception>
#include <memory>
#include <vector>

namespace cipher {

// Default plaintext accumulation capacity per frame
static constexpr size_t DEFAULT_CHUNK_CAPACITY = 1024;

// Largest plaintext sealed into a single frame; longer writes are split
static constexpr size_t MAX_FRAME_PLAINTEXT = 64u * 1024u * 1024u;

static constexpr size_t LENGTH_PREFIX_SIZE = 8;
static constexpr size_t FRAME_OVERHEAD     = crypto::NONCE_SIZE + crypto::TAG_SIZE;

enum class CodecState : u8 {
    ACTIVE = 0,
    FAILED = 1,
    CLOSED = 2,
};

class StreamEncryptor : public ByteWriter {
public:
    // capacity: plaintext bytes buffered before a frame is sealed
    StreamEncryptor(ByteWriter& inner, const crypto::Key& key,
                    size_t capacity = DEFAULT_CHUNK_CAPACITY);

    StreamEncryptor(const StreamEncryptor&) = delete;
    StreamEncryptor& operator=(const StreamEncryptor&) = delete;

    void write(const void* data, size_t len) override;

    // Seal the pending chunk (if any) and flush the inner stream
    void flush() override;

    // Seal the pending chunk and release the cipher.
    // The inner stream stays open.
    void close() override;

    CodecState state() const { return state_; }
    size_t capacity() const { return plaintext_.size(); }
    u64 frames_written() const { return frames_; }

private:
    ByteWriter&                     inner_;
    std::unique_ptr<crypto::AesGcm> aead_;
    std::vector<u8>                 plaintext_;   // fixed capacity
    size_t                          used_{0};
    std::vector<u8>                 frame_;       // scratch for one sealed frame
    u64                             frames_{0};
    CodecState                      state_{CodecState::ACTIVE};
    std::exception_ptr              failure_;

    void check_active();
    void fail();
    void seal_pending();
    void write_frame(const u8* pt, size_t len);
};

class StreamDecryptor : public ByteReader {
public:
    StreamDecryptor(ByteReader& inner, const crypto::Key& key);

    StreamDecryptor(const StreamDecryptor&) = delete;
    StreamDecryptor& operator=(const StreamDecryptor&) = delete;

    // Fills buf until it is full or the frame stream ends cleanly.
    // Returns 0 only at a clean end of stream (at a frame boundary).
    size_t read(void* buf, size_t len) override;

    // Releases the cipher. The inner stream stays open.
    void close() override;

    CodecState state() const { return state_; }

private:
    ByteReader&                     inner_;
    std::unique_ptr<crypto::AesGcm> aead_;
    std::vector<u8>                 ciphertext_;  // nonce + ct + tag of one frame
    std::vector<u8>                 plaintext_;   // last opened frame
    size_t                          cursor_{0};
    CodecState                      state_{CodecState::ACTIVE};
    std::exception_ptr              failure_;

    void check_active();
    void fail();

    // Read and open the next frame into plaintext_.
    // Returns false on clean end of stream.
    bool next_frame();
};

} // namespace cipher
