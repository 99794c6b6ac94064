#pragma once

// ============================================================
// errors.hpp -- Exception types reported by treepipe
//
// Every failure that aborts a run is one of these. The programs
// print what() and exit non-zero; nothing is retried.
// ============================================================

#include "platform.hpp"
#include <stdexcept>
#include <string>

// Dial / listen / accept / send / recv / close
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& msg)
        : std::runtime_error(msg) {}
};

enum class CodecErrc : u8 {
    NONCE_GENERATION = 1,
    SHORT_READ       = 2,
    AUTHENTICATION   = 3,
    LENGTH_PREFIX    = 4,
    CIPHER_INIT      = 5,
    STREAM_CLOSED    = 6,
};

inline const char* codec_errc_str(CodecErrc code) {
    switch (code) {
        case CodecErrc::NONCE_GENERATION: return "nonce generation failure";
        case CodecErrc::SHORT_READ:       return "short read";
        case CodecErrc::AUTHENTICATION:   return "authentication failure";
        case CodecErrc::LENGTH_PREFIX:    return "corrupt length prefix";
        case CodecErrc::CIPHER_INIT:      return "cipher init failure";
        case CodecErrc::STREAM_CLOSED:    return "stream closed";
    }
    return "unknown codec error";
}

// Encrypted stream framing / authentication
class CodecError : public std::runtime_error {
public:
    CodecError(CodecErrc code, const std::string& detail)
        : std::runtime_error(std::string(codec_errc_str(code)) +
                             (detail.empty() ? "" : ": " + detail))
        , code_(code) {}

    // SHORT_READ: how many bytes the frame promised vs. how many arrived
    static CodecError short_read(u64 expected, u64 actual) {
        CodecError e(CodecErrc::SHORT_READ,
                     "expected " + std::to_string(expected) +
                     " bytes, got " + std::to_string(actual));
        e.expected_ = expected;
        e.actual_   = actual;
        return e;
    }

    CodecErrc code() const { return code_; }
    u64 expected() const { return expected_; }
    u64 actual() const { return actual_; }

private:
    CodecErrc code_;
    u64 expected_{0};
    u64 actual_{0};
};

// zstd stream failures
class CompressError : public std::runtime_error {
public:
    explicit CompressError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Local file system: permissions, missing paths, mis-writes
class FilesystemError : public std::runtime_error {
public:
    explicit FilesystemError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Malformed archive record stream
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Bad command line or unusable passphrase (exit code 2)
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg)
        : std::runtime_error(msg) {}
};
