#pragma once

// ============================================================
// compress.hpp -- zstd streaming compression layer
// ============================================================

#include "platform.hpp"
#include "stream.hpp"
#include <vector>

#include <zstd.h>

namespace compress {

// Compression level 1 = fastest
static constexpr int ZSTD_LEVEL = 1;

// Compresses everything written into one zstd frame on the inner stream.
class ZstdWriter : public ByteWriter {
public:
    explicit ZstdWriter(ByteWriter& inner, int level = ZSTD_LEVEL);
    ~ZstdWriter() override;

    ZstdWriter(const ZstdWriter&) = delete;
    ZstdWriter& operator=(const ZstdWriter&) = delete;

    void write(const void* data, size_t len) override;

    // Emit a zstd block boundary so the peer can decode everything so far
    void flush() override;

    // End the frame. Does not close the inner stream.
    void close() override;

private:
    ByteWriter&     inner_;
    ZSTD_CCtx*      cctx_{nullptr};
    std::vector<u8> out_;
    bool            closed_{false};

    // Feed input (may be empty) until the directive is satisfied
    void drive(ZSTD_inBuffer& in, ZSTD_EndDirective mode);
};

// Decompresses a zstd stream read from the inner stream.
class ZstdReader : public ByteReader {
public:
    explicit ZstdReader(ByteReader& inner);
    ~ZstdReader() override;

    ZstdReader(const ZstdReader&) = delete;
    ZstdReader& operator=(const ZstdReader&) = delete;

    size_t read(void* buf, size_t len) override;

    void close() override;

private:
    ByteReader&     inner_;
    ZSTD_DCtx*      dctx_{nullptr};
    std::vector<u8> in_;
    ZSTD_inBuffer   in_buf_{nullptr, 0, 0};
    bool            eof_{false};
    bool            frame_open_{false};
    bool            output_pending_{false};  // last call filled the caller's buffer
};

} // namespace compress
