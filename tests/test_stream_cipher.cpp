#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../common/stream_cipher.hpp"
#include "../common/protocol_io.hpp"
#include "../common/errors.hpp"
#include <set>
#include <utility>
#include <string>
#include <vector>

using cipher::StreamEncryptor;
using cipher::StreamDecryptor;
using cipher::CodecState;

class StreamCipherTest : public ::testing::Test {
protected:
    crypto::Key key = crypto::derive_key(crypto::KEY_DOMAIN_TAG, "hunter2");
    crypto::Key other_key = crypto::derive_key(crypto::KEY_DOMAIN_TAG, "hunter3");

    // Frame lengths found by walking the length prefixes
    static std::vector<u64> frame_lengths(const std::vector<u8>& wire) {
        std::vector<u64> lens;
        size_t pos = 0;
        while (pos + cipher::LENGTH_PREFIX_SIZE <= wire.size()) {
            u64 len = proto::get_be64(wire.data() + pos);
            lens.push_back(len);
            pos += cipher::LENGTH_PREFIX_SIZE + (size_t)len;
        }
        EXPECT_EQ(pos, wire.size());
        return lens;
    }

    std::vector<u8> decrypt_all(const std::vector<u8>& wire, const crypto::Key& k, size_t read_size = 4096) {
        VectorReader src(wire);
        StreamDecryptor dec(src, k);
        std::vector<u8> out;
        std::vector<u8> buf(read_size);
        size_t n;
        while ((n = dec.read(buf.data(), buf.size())) > 0) {
            out.insert(out.end(), buf.begin(), buf.begin() + n);
        }
        dec.close();
        return out;
    }
};

//=============================================================================
// Round trip
//=============================================================================

TEST_F(StreamCipherTest, RoundTripMixedWrites) {
    VectorWriter sink;
    std::vector<u8> expected;
    {
        StreamEncryptor enc(sink, key);
        const size_t sizes[] = {1, 10, 500, 1023, 1024, 1025, 3000, 7, 0, 70000};
        u32 seed = 1;
        for (size_t n : sizes) {
            auto data = pattern_bytes(n, seed++);
            enc.write(data.data(), data.size());
            expected.insert(expected.end(), data.begin(), data.end());
        }
        enc.close();
    }
    EXPECT_EQ(decrypt_all(sink.data(), key), expected);
    // Tiny reads reassemble the same stream
    EXPECT_EQ(decrypt_all(sink.data(), key, 3), expected);
}

TEST_F(StreamCipherTest, EmptyStreamEmitsNothing) {
    VectorWriter sink;
    StreamEncryptor enc(sink, key);
    enc.close();
    EXPECT_TRUE(sink.data().empty());
    EXPECT_TRUE(decrypt_all(sink.data(), key).empty());
}

TEST_F(StreamCipherTest, FlushWithoutPendingDataEmitsNothing) {
    VectorWriter sink;
    StreamEncryptor enc(sink, key);
    enc.flush();
    enc.flush();
    EXPECT_TRUE(sink.data().empty());
    enc.close();
}

//=============================================================================
// Framing
//=============================================================================

TEST_F(StreamCipherTest, SmallWritesCoalesceIntoOneFrame) {
    VectorWriter sink;
    StreamEncryptor enc(sink, key, 1024);
    for (int i = 0; i < 10; ++i) enc.write("0123456789", 10);
    EXPECT_TRUE(sink.data().empty());
    enc.close();

    auto lens = frame_lengths(sink.data());
    ASSERT_EQ(lens.size(), 1u);
    EXPECT_EQ(lens[0], crypto::NONCE_SIZE + 100 + crypto::TAG_SIZE);
    EXPECT_EQ(sink.data().size(), cipher::LENGTH_PREFIX_SIZE + lens[0]);
}

TEST_F(StreamCipherTest, OverflowSealsPendingThenBuffers) {
    VectorWriter sink;
    StreamEncryptor enc(sink, key, 1024);
    auto a = pattern_bytes(1000, 1);
    auto b = pattern_bytes(100, 2);
    enc.write(a.data(), a.size());
    enc.write(b.data(), b.size());   // does not fit: seals a, buffers b
    EXPECT_EQ(frame_lengths(sink.data()).size(), 1u);
    enc.close();

    auto lens = frame_lengths(sink.data());
    ASSERT_EQ(lens.size(), 2u);
    EXPECT_EQ(lens[0], cipher::FRAME_OVERHEAD + 1000);
    EXPECT_EQ(lens[1], cipher::FRAME_OVERHEAD + 100);
}

TEST_F(StreamCipherTest, OversizedWriteIsItsOwnFrame) {
    VectorWriter sink;
    StreamEncryptor enc(sink, key, 1024);
    enc.write("abc", 3);
    auto big = pattern_bytes(5000, 3);
    enc.write(big.data(), big.size());
    enc.close();

    auto lens = frame_lengths(sink.data());
    ASSERT_EQ(lens.size(), 2u);
    EXPECT_EQ(lens[0], cipher::FRAME_OVERHEAD + 3);
    EXPECT_EQ(lens[1], cipher::FRAME_OVERHEAD + 5000);
    EXPECT_EQ(enc.frames_written(), 2u);
}

TEST_F(StreamCipherTest, EachFrameIsOneDownstreamWrite) {
    VectorWriter sink;
    StreamEncryptor enc(sink, key, 64);
    auto data = pattern_bytes(1000, 4);
    for (size_t off = 0; off < data.size(); off += 50) enc.write(data.data() + off, 50);
    enc.close();
    EXPECT_EQ(sink.write_calls(), frame_lengths(sink.data()).size());
}

TEST_F(StreamCipherTest, NoncesDifferBetweenFrames) {
    VectorWriter sink;
    StreamEncryptor enc(sink, key, 64);
    auto data = pattern_bytes(64, 5);
    enc.write(data.data(), data.size());
    enc.flush();
    enc.write(data.data(), data.size());
    enc.close();

    const auto& wire = sink.data();
    size_t frame = cipher::LENGTH_PREFIX_SIZE + cipher::FRAME_OVERHEAD + 64;
    ASSERT_EQ(wire.size(), 2 * frame);
    std::vector<u8> n1(wire.begin() + 8, wire.begin() + 8 + crypto::NONCE_SIZE);
    std::vector<u8> n2(wire.begin() + frame + 8, wire.begin() + frame + 8 + crypto::NONCE_SIZE);
    EXPECT_NE(n1, n2);
    // Same plaintext, different ciphertext
    EXPECT_NE(std::vector<u8>(wire.begin() + 20, wire.begin() + 84),
              std::vector<u8>(wire.begin() + frame + 20, wire.begin() + frame + 84));
}

TEST_F(StreamCipherTest, NoncesUniqueAcrossManyFrames) {
    const size_t frames = 256;
    VectorWriter sink;
    StreamEncryptor enc(sink, key, 16);
    auto block = pattern_bytes(16, 9);
    for (size_t i = 0; i < frames; ++i) {
        enc.write(block.data(), block.size());
        enc.flush();
    }
    enc.close();

    const auto& wire = sink.data();
    auto lens = frame_lengths(wire);
    ASSERT_EQ(lens.size(), frames);

    std::set<std::vector<u8>> nonces;
    size_t pos = 0;
    for (u64 len : lens) {
        const u8* nonce = wire.data() + pos + cipher::LENGTH_PREFIX_SIZE;
        nonces.insert(std::vector<u8>(nonce, nonce + crypto::NONCE_SIZE));
        pos += cipher::LENGTH_PREFIX_SIZE + (size_t)len;
    }
    EXPECT_EQ(nonces.size(), frames);
}

TEST_F(StreamCipherTest, InvalidCapacityRejected) {
    VectorWriter sink;
    EXPECT_THROW(StreamEncryptor(sink, key, 0), std::invalid_argument);
}

//=============================================================================
// Lifecycle
//=============================================================================

TEST_F(StreamCipherTest, CloseTwiceIsNoop) {
    VectorWriter sink;
    StreamEncryptor enc(sink, key);
    enc.write("x", 1);
    enc.close();
    size_t size = sink.data().size();
    EXPECT_NO_THROW(enc.close());
    EXPECT_EQ(sink.data().size(), size);
    EXPECT_EQ(enc.state(), CodecState::CLOSED);
}

TEST_F(StreamCipherTest, WriteAfterCloseFails) {
    VectorWriter sink;
    StreamEncryptor enc(sink, key);
    enc.close();
    try {
        enc.write("x", 1);
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::STREAM_CLOSED);
    }
}

// Downstream that fails on every write
class BrokenWriter : public ByteWriter {
public:
    int calls = 0;
    void write(const void*, size_t) override {
        ++calls;
        throw TransportError("connection reset");
    }
};

TEST_F(StreamCipherTest, DownstreamFailureIsSticky) {
    BrokenWriter broken;
    StreamEncryptor enc(broken, key, 64);
    auto data = pattern_bytes(100, 6);
    EXPECT_THROW(enc.write(data.data(), data.size()), TransportError);
    EXPECT_EQ(enc.state(), CodecState::FAILED);
    EXPECT_EQ(broken.calls, 1);

    // Stored error is reported without touching the downstream again
    EXPECT_THROW(enc.write("x", 1), TransportError);
    EXPECT_THROW(enc.flush(), TransportError);
    EXPECT_EQ(broken.calls, 1);
    EXPECT_THROW(enc.close(), TransportError);
    EXPECT_EQ(broken.calls, 1);

    // Closing again reports the same failure
    EXPECT_THROW(enc.close(), TransportError);
    EXPECT_EQ(enc.state(), CodecState::CLOSED);
}

//=============================================================================
// Decryptor failures
//=============================================================================

TEST_F(StreamCipherTest, WrongKeyFailsAuthentication) {
    VectorWriter sink;
    {
        StreamEncryptor enc(sink, key);
        enc.write("secret data", 11);
        enc.close();
    }
    VectorReader src(sink.data());
    StreamDecryptor dec(src, other_key);
    u8 buf[64];
    try {
        dec.read(buf, sizeof(buf));
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::AUTHENTICATION);
    }
    EXPECT_EQ(dec.state(), CodecState::FAILED);
}

TEST_F(StreamCipherTest, TamperedByteFailsAndStaysFailed) {
    VectorWriter sink;
    {
        StreamEncryptor enc(sink, key, 64);
        auto data = pattern_bytes(200, 7);
        enc.write(data.data(), data.size());
        enc.close();
    }
    std::vector<u8> wire = sink.data();
    wire[cipher::LENGTH_PREFIX_SIZE + crypto::NONCE_SIZE + 5] ^= 0x80;

    VectorReader src(wire);
    StreamDecryptor dec(src, key);
    u8 buf[16];
    EXPECT_THROW(dec.read(buf, sizeof(buf)), CodecError);
    size_t left = src.remaining();
    try {
        dec.read(buf, sizeof(buf));
        FAIL() << "expected sticky failure";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::AUTHENTICATION);
    }
    EXPECT_EQ(src.remaining(), left);
    EXPECT_THROW(dec.close(), CodecError);
}

TEST_F(StreamCipherTest, TruncatedBodyIsShortRead) {
    VectorWriter sink;
    {
        StreamEncryptor enc(sink, key);
        enc.write("0123456789", 10);
        enc.close();
    }
    std::vector<u8> wire = sink.data();
    wire.resize(wire.size() - 5);

    VectorReader src(wire);
    StreamDecryptor dec(src, key);
    u8 buf[32];
    try {
        dec.read(buf, sizeof(buf));
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::SHORT_READ);
        EXPECT_EQ(e.expected(), cipher::FRAME_OVERHEAD + 10);
        EXPECT_EQ(e.actual(), cipher::FRAME_OVERHEAD + 10 - 5);
    }
}

TEST_F(StreamCipherTest, PartialLengthPrefixIsShortRead) {
    std::vector<u8> wire = {0, 0, 0};
    VectorReader src(wire);
    StreamDecryptor dec(src, key);
    u8 buf[8];
    try {
        dec.read(buf, sizeof(buf));
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::SHORT_READ);
        EXPECT_EQ(e.expected(), 8u);
        EXPECT_EQ(e.actual(), 3u);
    }
}

TEST_F(StreamCipherTest, AbsurdLengthPrefixRejected) {
    std::vector<u8> wire(8 + 64);
    proto::put_be64(wire.data(), 1ull << 40);
    VectorReader src(wire);
    StreamDecryptor dec(src, key);
    u8 buf[8];
    try {
        dec.read(buf, sizeof(buf));
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::LENGTH_PREFIX);
    }
}

TEST_F(StreamCipherTest, TooShortLengthPrefixRejected) {
    std::vector<u8> wire(8 + 64);
    proto::put_be64(wire.data(), cipher::FRAME_OVERHEAD - 1);
    VectorReader src(wire);
    StreamDecryptor dec(src, key);
    u8 buf[8];
    try {
        dec.read(buf, sizeof(buf));
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::LENGTH_PREFIX);
    }
}

TEST_F(StreamCipherTest, ReadAfterCloseFails) {
    VectorReader src(std::vector<u8>{});
    StreamDecryptor dec(src, key);
    dec.close();
    u8 b;
    EXPECT_THROW(dec.read(&b, 1), CodecError);
}

TEST_F(StreamCipherTest, FrameBoundaryEofIsClean) {
    VectorWriter sink;
    {
        StreamEncryptor enc(sink, key);
        enc.write("abc", 3);
        enc.close();
    }
    VectorReader src(sink.data());
    StreamDecryptor dec(src, key);
    u8 buf[3];
    EXPECT_EQ(dec.read(buf, 3), 3u);
    EXPECT_EQ(dec.read(buf, 3), 0u);
    EXPECT_EQ(dec.read(buf, 3), 0u);
    EXPECT_EQ(dec.state(), CodecState::ACTIVE);
}

//=============================================================================
// Frame-boundary totals
//=============================================================================

static constexpr size_t BOUNDARY_CAPACITY = 64;

class StreamBoundaryTest : public ::testing::TestWithParam<size_t> {
protected:
    crypto::Key key = crypto::derive_key(crypto::KEY_DOMAIN_TAG, "boundary");

    // Plaintext length of every frame in wire
    static std::vector<size_t> frame_payloads(const std::vector<u8>& wire) {
        std::vector<size_t> out;
        size_t pos = 0;
        while (pos < wire.size()) {
            u64 len = proto::get_be64(wire.data() + pos);
            out.push_back((size_t)len - cipher::FRAME_OVERHEAD);
            pos += cipher::LENGTH_PREFIX_SIZE + (size_t)len;
        }
        EXPECT_EQ(pos, wire.size());
        return out;
    }

    std::vector<u8> decrypt(const std::vector<u8>& wire) {
        VectorReader src(wire);
        StreamDecryptor dec(src, key);
        std::vector<u8> out;
        u8 buf[37];
        size_t n;
        while ((n = dec.read(buf, sizeof(buf))) > 0) out.insert(out.end(), buf, buf + n);
        EXPECT_EQ(dec.read(buf, sizeof(buf)), 0u);
        dec.close();
        return out;
    }
};

TEST_P(StreamBoundaryTest, SingleWriteRoundTrip) {
    const size_t total = GetParam();
    auto data = pattern_bytes(total, (u32)total);
    VectorWriter sink;
    StreamEncryptor enc(sink, key, BOUNDARY_CAPACITY);
    enc.write(data.data(), data.size());
    enc.close();

    auto payloads = frame_payloads(sink.data());
    ASSERT_EQ(payloads.size(), 1u);
    EXPECT_EQ(payloads[0], total);
    EXPECT_EQ(decrypt(sink.data()), data);
}

TEST_P(StreamBoundaryTest, ByteAtATimeRoundTrip) {
    const size_t total = GetParam();
    auto data = pattern_bytes(total, (u32)total + 1);
    VectorWriter sink;
    StreamEncryptor enc(sink, key, BOUNDARY_CAPACITY);
    for (u8 b : data) enc.write(&b, 1);
    enc.close();

    // Full frames of C, then one remainder frame; never an empty frame
    auto payloads = frame_payloads(sink.data());
    size_t full = total / BOUNDARY_CAPACITY;
    size_t rest = total % BOUNDARY_CAPACITY;
    ASSERT_EQ(payloads.size(), full + (rest ? 1 : 0));
    for (size_t i = 0; i < full; ++i) EXPECT_EQ(payloads[i], BOUNDARY_CAPACITY);
    if (rest) EXPECT_EQ(payloads.back(), rest);
    EXPECT_EQ(decrypt(sink.data()), data);
}

INSTANTIATE_TEST_SUITE_P(FrameTotals, StreamBoundaryTest,
    ::testing::Values(size_t{1},
                      BOUNDARY_CAPACITY - 1,
                      BOUNDARY_CAPACITY,
                      BOUNDARY_CAPACITY + 1,
                      2 * BOUNDARY_CAPACITY,
                      5 * BOUNDARY_CAPACITY,
                      5 * BOUNDARY_CAPACITY + 1));

//=============================================================================
// Tampering by frame region
//=============================================================================

enum class FrameRegion { NONCE, CIPHERTEXT, TAG };

class FrameTamperTest : public ::testing::TestWithParam<FrameRegion> {
protected:
    crypto::Key key = crypto::derive_key(crypto::KEY_DOMAIN_TAG, "tamper");
    static constexpr size_t PAYLOAD = 48;

    std::vector<u8> sealed_frames(size_t count) {
        VectorWriter sink;
        StreamEncryptor enc(sink, key, PAYLOAD);
        auto data = pattern_bytes(PAYLOAD * count, 21);
        for (size_t i = 0; i < count; ++i) {
            enc.write(data.data() + i * PAYLOAD, PAYLOAD);
        }
        enc.close();
        return sink.data();
    }

    // Byte offsets of the region inside the frame starting at frame_start
    std::pair<size_t, size_t> region(size_t frame_start) const {
        size_t body = frame_start + cipher::LENGTH_PREFIX_SIZE;
        switch (GetParam()) {
            case FrameRegion::NONCE:
                return {body, body + crypto::NONCE_SIZE};
            case FrameRegion::CIPHERTEXT:
                return {body + crypto::NONCE_SIZE, body + crypto::NONCE_SIZE + PAYLOAD};
            case FrameRegion::TAG:
                return {body + crypto::NONCE_SIZE + PAYLOAD,
                        body + crypto::NONCE_SIZE + PAYLOAD + crypto::TAG_SIZE};
        }
        return {0, 0};
    }
};

TEST_P(FrameTamperTest, EveryFlippedByteFailsWithoutPlaintext) {
    const auto wire = sealed_frames(1);
    auto range = region(0);
    for (size_t at = range.first; at < range.second; ++at) {
        std::vector<u8> bad = wire;
        bad[at] ^= 0x01;

        VectorReader src(bad);
        StreamDecryptor dec(src, key);
        std::vector<u8> buf(PAYLOAD, 0xEE);
        try {
            dec.read(buf.data(), buf.size());
            ADD_FAILURE() << "flip at byte " << at << " was accepted";
        } catch (const CodecError& e) {
            EXPECT_EQ(e.code(), CodecErrc::AUTHENTICATION) << "byte " << at;
        }
        EXPECT_EQ(buf, std::vector<u8>(PAYLOAD, 0xEE)) << "byte " << at;
        EXPECT_EQ(dec.state(), CodecState::FAILED);
    }
}

TEST_P(FrameTamperTest, LaterFrameFailsAfterIntactOne) {
    const auto wire = sealed_frames(2);
    const size_t frame_size = cipher::LENGTH_PREFIX_SIZE + cipher::FRAME_OVERHEAD + PAYLOAD;
    ASSERT_EQ(wire.size(), 2 * frame_size);

    std::vector<u8> bad = wire;
    bad[region(frame_size).first] ^= 0x80;

    VectorReader src(bad);
    StreamDecryptor dec(src, key);
    std::vector<u8> first(PAYLOAD);
    ASSERT_EQ(dec.read(first.data(), first.size()), PAYLOAD);
    auto expected = pattern_bytes(2 * PAYLOAD, 21);
    EXPECT_EQ(first, std::vector<u8>(expected.begin(), expected.begin() + PAYLOAD));

    u8 more[PAYLOAD];
    try {
        dec.read(more, sizeof(more));
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.code(), CodecErrc::AUTHENTICATION);
    }
}

INSTANTIATE_TEST_SUITE_P(Regions, FrameTamperTest,
    ::testing::Values(FrameRegion::NONCE, FrameRegion::CIPHERTEXT, FrameRegion::TAG),
    [](const ::testing::TestParamInfo<FrameRegion>& info) {
        switch (info.param) {
            case FrameRegion::NONCE:      return std::string("Nonce");
            case FrameRegion::CIPHERTEXT: return std::string("Ciphertext");
            case FrameRegion::TAG:        return std::string("Tag");
        }
        return std::string("Unknown");
    });
