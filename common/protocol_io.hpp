#pragma once

// ============================================================
// protocol_io.hpp -- Byte-order helpers and record header codec
// ============================================================

#include "protocol.hpp"
#include <cstring>

// Linux: htobe16/32/64 and be16/32/64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u32 hton32(u32 v) {
#if defined(_WIN32)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u32 ntoh32(u32 v) {
#if defined(_WIN32)
    return ntohl(v);
#else
    return be32toh(v);
#endif
}

inline u64 ntoh64(u64 v) {
#if defined(_WIN32)
    return (((u64)ntohl((u32)(v & 0xFFFFFFFFull))) << 32) | ntohl((u32)(v >> 32));
#else
    return be64toh(v);
#endif
}

// ---- Unaligned big-endian access ----

inline void put_be64(u8* p, u64 v) {
    v = hton64(v);
    std::memcpy(p, &v, 8);
}

inline u64 get_be64(const u8* p) {
    u64 v;
    std::memcpy(&v, p, 8);
    return ntoh64(v);
}

// ---- Encode individual struct fields (in-place, host->network) ----

inline void encode_record_header(RecordHeader& h) {
    // magic, kind: single bytes, no swap needed
    h.mode     = hton32(h.mode);
    h.size     = hton64(h.size);
    h.mtime_ns = hton64(h.mtime_ns);
    h.name_len = hton16(h.name_len);
    h.link_len = hton16(h.link_len);
}

inline void decode_record_header(RecordHeader& h) {
    h.mode     = ntoh32(h.mode);
    h.size     = ntoh64(h.size);
    h.mtime_ns = ntoh64(h.mtime_ns);
    h.name_len = ntoh16(h.name_len);
    h.link_len = ntoh16(h.link_len);
}

} // namespace proto
