#pragma once

// ============================================================
// layers.hpp -- Optional compression / encryption around a stream
//
// Send:    app -> AES-GCM frames -> zstd -> write buffer -> sink
// Receive: source -> zstd -> AES-GCM frames -> app
//
// Each enabled layer lives for exactly one call and is closed on
// every exit path, innermost first. The first error raised (by
// the callback or by any close) is the one propagated. The sink
// and source themselves are never closed here.
// ============================================================

#include "platform.hpp"
#include "stream.hpp"
#include "crypto.hpp"
#include "stream_cipher.hpp"
#include <functional>

namespace layers {

struct LayerOptions {
    bool        use_compress{false};
    bool        use_encrypt{false};
    crypto::Key key{};                                   // used when use_encrypt
    size_t      chunk_capacity{cipher::DEFAULT_CHUNK_CAPACITY};
};

using WriterFn = std::function<void(ByteWriter&)>;
using ReaderFn = std::function<void(ByteReader&)>;

void with_send_layers(ByteWriter& sink, const LayerOptions& opts, const WriterFn& fn);

void with_receive_layers(ByteReader& source, const LayerOptions& opts, const ReaderFn& fn);

// Human-readable stack description for logs, e.g. "zstd+aes-gcm"
std::string describe(const LayerOptions& opts);

} // namespace layers
