#pragma once

// ============================================================
// write_buffer.hpp -- Application-level write buffer
//
// Coalesces many small writes (record headers, names, small AES
// frames) into a few large send() syscalls. The per-call cost
// with TCP_NODELAY dominates when thousands of small entries
// are streamed.
//
// Usage:
//   {
//       BufferedWriter wbuf(socket_writer);
//       ... wbuf.write(...) ...
//       wbuf.close();        // flushes
//   }
//
// Thread safety: NOT thread-safe; one buffer per connection.
// ============================================================

#include "stream.hpp"
#include <vector>

class BufferedWriter : public ByteWriter {
public:
    // Flush when the internal buffer reaches this size.
    // 256 KB amortises syscall overhead while still fitting in L2/L3.
    static constexpr size_t DEFAULT_THRESHOLD = 256 * 1024;

    explicit BufferedWriter(ByteWriter& inner,
                            size_t threshold = DEFAULT_THRESHOLD)
        : inner_(inner), threshold_(threshold)
    {
        buf_.reserve(threshold);
    }

    // Non-copyable, non-movable (holds a reference to the inner stream)
    BufferedWriter(const BufferedWriter&) = delete;
    BufferedWriter& operator=(const BufferedWriter&) = delete;

    void write(const void* data, size_t len) override {
        // Large writes bypass the buffer once it has been drained
        if (len >= threshold_) {
            flush();
            inner_.write(data, len);
            return;
        }
        const u8* p = static_cast<const u8*>(data);
        buf_.insert(buf_.end(), p, p + len);
        if (buf_.size() >= threshold_) flush();
    }

    // Send all buffered data to the inner stream in one call.
    void flush() override {
        if (!buf_.empty()) {
            inner_.write(buf_.data(), buf_.size());
            buf_.clear();
        }
        inner_.flush();
    }

    void close() override { flush(); }

private:
    ByteWriter&     inner_;
    size_t          threshold_;
    std::vector<u8> buf_;
};
