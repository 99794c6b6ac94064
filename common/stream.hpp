#pragma once

// ============================================================
// stream.hpp -- Sequential byte stream interfaces
//
// Every layer of the pipe (socket, zstd, AES-GCM frames) is a
// ByteWriter on the send side and a ByteReader on the receive
// side. Layers never seek.
//
// close() finishes the layer itself (flushes trailers, releases
// contexts) but never closes the stream it wraps; the owner of
// the inner stream closes it.
// ============================================================

#include "platform.hpp"
#include <vector>
#include <cstring>
#include <algorithm>

class ByteWriter {
public:
    virtual ~ByteWriter() = default;

    // Write all of data or throw
    virtual void write(const void* data, size_t len) = 0;

    // Push buffered bytes down to the wrapped stream
    virtual void flush() {}

    virtual void close() {}
};

class ByteReader {
public:
    virtual ~ByteReader() = default;

    // Read up to len bytes. Returns 0 only at end of stream.
    virtual size_t read(void* buf, size_t len) = 0;

    virtual void close() {}
};

// Read until len bytes arrived or the stream ended.
// Returns the number of bytes read (< len only at end of stream).
inline size_t read_full(ByteReader& r, void* buf, size_t len) {
    u8* p = static_cast<u8*>(buf);
    size_t got = 0;
    while (got < len) {
        size_t n = r.read(p + got, len - got);
        if (n == 0) break;
        got += n;
    }
    return got;
}

// ---- In-memory streams ----

class VectorWriter : public ByteWriter {
public:
    void write(const void* data, size_t len) override {
        const u8* p = static_cast<const u8*>(data);
        buf_.insert(buf_.end(), p, p + len);
        ++writes_;
    }

    const std::vector<u8>& data() const { return buf_; }
    std::vector<u8>& data() { return buf_; }
    size_t write_calls() const { return writes_; }

private:
    std::vector<u8> buf_;
    size_t writes_{0};
};

class VectorReader : public ByteReader {
public:
    explicit VectorReader(std::vector<u8> data) : buf_(std::move(data)) {}

    size_t read(void* buf, size_t len) override {
        size_t n = std::min(len, buf_.size() - pos_);
        if (n > 0) {
            std::memcpy(buf, buf_.data() + pos_, n);
            pos_ += n;
        }
        return n;
    }

    size_t remaining() const { return buf_.size() - pos_; }

private:
    std::vector<u8> buf_;
    size_t pos_{0};
};
