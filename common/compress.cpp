// ============================================================
// compress.cpp -- zstd streaming compression layer
// ============================================================

#include "compress.hpp"
#include "errors.hpp"
#include <string>

namespace compress {

static void check_zstd(size_t rc, const char* what) {
    if (ZSTD_isError(rc)) {
        throw CompressError(std::string("ZSTD ") + what + " error: " + ZSTD_getErrorName(rc));
    }
}

// ---- ZstdWriter ----

ZstdWriter::ZstdWriter(ByteWriter& inner, int level)
    : inner_(inner)
    , out_(ZSTD_CStreamOutSize())
{
    cctx_ = ZSTD_createCCtx();
    if (!cctx_) throw CompressError("ZSTD_createCCtx failed");
    size_t rc = ZSTD_CCtx_setParameter(cctx_, ZSTD_c_compressionLevel, level);
    if (ZSTD_isError(rc)) {
        ZSTD_freeCCtx(cctx_);
        cctx_ = nullptr;
        check_zstd(rc, "set level");
    }
}

ZstdWriter::~ZstdWriter() {
    if (cctx_) ZSTD_freeCCtx(cctx_);
}

void ZstdWriter::drive(ZSTD_inBuffer& in, ZSTD_EndDirective mode) {
    for (;;) {
        ZSTD_outBuffer out{out_.data(), out_.size(), 0};
        size_t remaining = ZSTD_compressStream2(cctx_, &out, &in, mode);
        check_zstd(remaining, "compress");
        if (out.pos > 0) inner_.write(out_.data(), out.pos);

        if (mode == ZSTD_e_continue) {
            if (in.pos == in.size) return;
        } else if (remaining == 0) {
            return;
        }
    }
}

void ZstdWriter::write(const void* data, size_t len) {
    if (closed_) throw CompressError("write to closed zstd stream");
    ZSTD_inBuffer in{data, len, 0};
    drive(in, ZSTD_e_continue);
}

void ZstdWriter::flush() {
    if (closed_) return;
    ZSTD_inBuffer in{nullptr, 0, 0};
    drive(in, ZSTD_e_flush);
    inner_.flush();
}

void ZstdWriter::close() {
    if (closed_) return;
    closed_ = true;
    ZSTD_inBuffer in{nullptr, 0, 0};
    drive(in, ZSTD_e_end);
    inner_.flush();
    ZSTD_freeCCtx(cctx_);
    cctx_ = nullptr;
}

// ---- ZstdReader ----

ZstdReader::ZstdReader(ByteReader& inner)
    : inner_(inner)
    , in_(ZSTD_DStreamInSize())
{
    dctx_ = ZSTD_createDCtx();
    if (!dctx_) throw CompressError("ZSTD_createDCtx failed");
    in_buf_ = ZSTD_inBuffer{in_.data(), 0, 0};
}

ZstdReader::~ZstdReader() {
    if (dctx_) ZSTD_freeDCtx(dctx_);
}

size_t ZstdReader::read(void* buf, size_t len) {
    if (!dctx_) throw CompressError("read from closed zstd stream");
    if (len == 0) return 0;

    ZSTD_outBuffer out{buf, len, 0};
    while (out.pos == 0) {
        // Input exhausted and no output held back by the decoder
        if (in_buf_.pos == in_buf_.size && !output_pending_) {
            if (eof_) break;
            size_t n = inner_.read(in_.data(), in_.size());
            if (n == 0) {
                eof_ = true;
                break;
            }
            in_buf_ = ZSTD_inBuffer{in_.data(), n, 0};
            frame_open_ = true;
        }
        size_t rc = ZSTD_decompressStream(dctx_, &out, &in_buf_);
        check_zstd(rc, "decompress");
        frame_open_     = (rc != 0);
        output_pending_ = (out.pos == out.size);
    }

    if (out.pos == 0 && frame_open_) {
        throw CompressError("zstd stream truncated mid-frame");
    }
    return out.pos;
}

void ZstdReader::close() {
    if (dctx_) {
        ZSTD_freeDCtx(dctx_);
        dctx_ = nullptr;
    }
}

} // namespace compress
