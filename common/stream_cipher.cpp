// ============================================================
// stream_cipher.cpp -- Chunked AES-256-GCM stream codec
// ============================================================

#include "stream_cipher.hpp"
#include "errors.hpp"
#include "protocol_io.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace cipher {

// ============================================================
// StreamEncryptor
// ============================================================

StreamEncryptor::StreamEncryptor(ByteWriter& inner, const crypto::Key& key, size_t capacity)
    : inner_(inner)
{
    if (capacity == 0 || capacity > MAX_FRAME_PLAINTEXT) {
        throw std::invalid_argument("StreamEncryptor: capacity must be 1.." +
                                    std::to_string(MAX_FRAME_PLAINTEXT));
    }
    aead_ = std::make_unique<crypto::AesGcm>(key);
    plaintext_.resize(capacity);
    frame_.reserve(LENGTH_PREFIX_SIZE + FRAME_OVERHEAD + capacity);
}

void StreamEncryptor::check_active() {
    if (state_ == CodecState::FAILED) std::rethrow_exception(failure_);
    if (state_ == CodecState::CLOSED) {
        throw CodecError(CodecErrc::STREAM_CLOSED, "write after close");
    }
}

// Called from a catch block: remember the error, drop the cipher
void StreamEncryptor::fail() {
    failure_ = std::current_exception();
    state_   = CodecState::FAILED;
    aead_.reset();
}

void StreamEncryptor::write_frame(const u8* pt, size_t len) {
    size_t body = crypto::NONCE_SIZE + len + crypto::TAG_SIZE;
    frame_.resize(LENGTH_PREFIX_SIZE + body);

    proto::put_be64(frame_.data(), (u64)body);
    u8* nonce = frame_.data() + LENGTH_PREFIX_SIZE;
    crypto::random_bytes(nonce, crypto::NONCE_SIZE);
    aead_->seal(nonce, pt, len, nonce + crypto::NONCE_SIZE);

    // Length, nonce and sealed data leave in one write
    inner_.write(frame_.data(), frame_.size());
    ++frames_;
}

void StreamEncryptor::seal_pending() {
    if (used_ == 0) return;
    size_t n = used_;
    used_ = 0;
    write_frame(plaintext_.data(), n);
}

void StreamEncryptor::write(const void* data, size_t len) {
    check_active();
    if (len == 0) return;
    const u8* p = static_cast<const u8*>(data);
    try {
        // Fits into the pending chunk
        if (used_ + len <= plaintext_.size()) {
            std::memcpy(plaintext_.data() + used_, p, len);
            used_ += len;
            return;
        }

        seal_pending();

        if (len <= plaintext_.size()) {
            std::memcpy(plaintext_.data(), p, len);
            used_ = len;
            return;
        }

        // Oversized: sealed directly, never buffered
        while (len > 0) {
            size_t n = std::min(len, MAX_FRAME_PLAINTEXT);
            write_frame(p, n);
            p   += n;
            len -= n;
        }
    } catch (...) {
        fail();
        throw;
    }
}

void StreamEncryptor::flush() {
    check_active();
    try {
        seal_pending();
        inner_.flush();
    } catch (...) {
        fail();
        throw;
    }
}

void StreamEncryptor::close() {
    // A repeated close reports the same outcome as the first one
    if (state_ == CodecState::CLOSED) {
        if (failure_) std::rethrow_exception(failure_);
        return;
    }
    if (state_ == CodecState::FAILED) {
        state_ = CodecState::CLOSED;
        std::rethrow_exception(failure_);
    }
    try {
        seal_pending();
    } catch (...) {
        fail();
        state_ = CodecState::CLOSED;
        throw;
    }
    aead_.reset();
    state_ = CodecState::CLOSED;
}

// ============================================================
// StreamDecryptor
// ============================================================

StreamDecryptor::StreamDecryptor(ByteReader& inner, const crypto::Key& key)
    : inner_(inner)
    , aead_(std::make_unique<crypto::AesGcm>(key))
{}

void StreamDecryptor::check_active() {
    if (state_ == CodecState::FAILED) std::rethrow_exception(failure_);
    if (state_ == CodecState::CLOSED) {
        throw CodecError(CodecErrc::STREAM_CLOSED, "read after close");
    }
}

void StreamDecryptor::fail() {
    failure_ = std::current_exception();
    state_   = CodecState::FAILED;
    aead_.reset();
    plaintext_.clear();
    cursor_ = 0;
}

bool StreamDecryptor::next_frame() {
    u8 prefix[LENGTH_PREFIX_SIZE];
    size_t got = read_full(inner_, prefix, sizeof(prefix));
    if (got == 0) return false;
    if (got < sizeof(prefix)) {
        throw CodecError::short_read(sizeof(prefix), got);
    }

    u64 size = proto::get_be64(prefix);
    if (size < FRAME_OVERHEAD || size > FRAME_OVERHEAD + MAX_FRAME_PLAINTEXT) {
        throw CodecError(CodecErrc::LENGTH_PREFIX,
                         "frame length " + std::to_string(size) + " out of range");
    }

    ciphertext_.resize((size_t)size);
    got = read_full(inner_, ciphertext_.data(), ciphertext_.size());
    if (got < ciphertext_.size()) {
        throw CodecError::short_read(size, got);
    }

    size_t pt_len = (size_t)size - FRAME_OVERHEAD;
    std::vector<u8> opened(pt_len);
    const u8* nonce = ciphertext_.data();
    if (!aead_->open(nonce, nonce + crypto::NONCE_SIZE, pt_len, opened.data())) {
        throw CodecError(CodecErrc::AUTHENTICATION,
                         "frame of " + std::to_string(size) + " bytes failed to verify");
    }

    plaintext_.swap(opened);
    cursor_ = 0;
    return true;
}

size_t StreamDecryptor::read(void* buf, size_t len) {
    check_active();
    u8* out = static_cast<u8*>(buf);
    size_t copied = 0;
    try {
        while (copied < len) {
            if (cursor_ == plaintext_.size()) {
                if (!next_frame()) break;
                continue;
            }
            size_t n = std::min(len - copied, plaintext_.size() - cursor_);
            std::memcpy(out + copied, plaintext_.data() + cursor_, n);
            copied  += n;
            cursor_ += n;
        }
    } catch (...) {
        fail();
        throw;
    }
    return copied;
}

void StreamDecryptor::close() {
    if (state_ == CodecState::CLOSED) {
        if (failure_) std::rethrow_exception(failure_);
        return;
    }
    bool failed = state_ == CodecState::FAILED;
    aead_.reset();
    plaintext_.clear();
    ciphertext_.clear();
    state_ = CodecState::CLOSED;
    if (failed) std::rethrow_exception(failure_);
}

} // namespace cipher
