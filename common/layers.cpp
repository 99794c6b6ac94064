// ============================================================
// layers.cpp -- Optional compression / encryption around a stream
// ============================================================

#include "layers.hpp"
#include "compress.hpp"
#include "scoped_close.hpp"
#include "write_buffer.hpp"

namespace layers {

// ---- Send side ----

static void with_encryptor(ByteWriter& w, const LayerOptions& opts, const WriterFn& fn) {
    if (!opts.use_encrypt) {
        fn(w);
        return;
    }
    cipher::StreamEncryptor enc(w, opts.key, opts.chunk_capacity);
    run_then_close([&] { fn(enc); },
                   [&] { enc.close(); });
}

static void with_compressor(ByteWriter& w, const LayerOptions& opts, const WriterFn& fn) {
    if (!opts.use_compress) {
        with_encryptor(w, opts, fn);
        return;
    }
    compress::ZstdWriter zw(w);
    run_then_close([&] { with_encryptor(zw, opts, fn); },
                   [&] { zw.close(); });
}

void with_send_layers(ByteWriter& sink, const LayerOptions& opts, const WriterFn& fn) {
    BufferedWriter wbuf(sink);
    run_then_close([&] { with_compressor(wbuf, opts, fn); },
                   [&] { wbuf.close(); });
}

// ---- Receive side ----

static void with_decryptor(ByteReader& r, const LayerOptions& opts, const ReaderFn& fn) {
    if (!opts.use_encrypt) {
        fn(r);
        return;
    }
    cipher::StreamDecryptor dec(r, opts.key);
    run_then_close([&] { fn(dec); },
                   [&] { dec.close(); });
}

void with_receive_layers(ByteReader& source, const LayerOptions& opts, const ReaderFn& fn) {
    if (!opts.use_compress) {
        with_decryptor(source, opts, fn);
        return;
    }
    compress::ZstdReader zr(source);
    run_then_close([&] { with_decryptor(zr, opts, fn); },
                   [&] { zr.close(); });
}

std::string describe(const LayerOptions& opts) {
    std::string s;
    if (opts.use_compress) s = "zstd";
    if (opts.use_encrypt) {
        if (!s.empty()) s += "+";
        s += "aes-gcm";
    }
    return s.empty() ? "plain" : s;
}

} // namespace layers
