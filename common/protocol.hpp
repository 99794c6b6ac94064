#pragma once

// protocol.hpp -- Archive record format for treepipe

#include "platform.hpp"
#include <cstring>

// Magic number: "TPR1"
static constexpr u32 TREEPIPE_MAGIC = 0x54505231u;

static constexpr u16 MAX_NAME_LEN = 4096;
static constexpr u16 MAX_LINK_LEN = 4096;

// Payload of a regular file is written in slices of this size
static constexpr size_t PAYLOAD_SLICE = 64u * 1024u;

// Permission bits carried in RecordHeader::mode
static constexpr u32 MODE_MASK = 07777u;

// ---- Node kinds ----
enum class NodeKind : u8 {
    END       = 0,   // terminates the archive
    REGULAR   = 1,
    DIRECTORY = 2,
    SYMLINK   = 3,
    FIFO      = 4,
};

inline const char* node_kind_str(NodeKind k) {
    switch (k) {
        case NodeKind::END:       return "end";
        case NodeKind::REGULAR:   return "file";
        case NodeKind::DIRECTORY: return "dir";
        case NodeKind::SYMLINK:   return "symlink";
        case NodeKind::FIFO:      return "fifo";
    }
    return "unknown";
}

inline bool node_kind_valid(u8 k) {
    return k <= (u8)NodeKind::FIFO;
}

// ============================================================
// Packed structures (wire format, big-endian)
// ============================================================
#pragma pack(push, 1)

// RecordHeader: 36 bytes fixed + name + link target + payload
struct RecordHeader {
    u8  magic[4];
    u8  kind;
    u8  pad[3];
    u32 mode;
    u64 size;       // payload bytes, REGULAR only
    u64 mtime_ns;
    u16 name_len;
    u16 link_len;
    u8  pad2[4];
};
static_assert(sizeof(RecordHeader) == 36, "RecordHeader size mismatch");

#pragma pack(pop)

// ---- Inline helpers ----
inline void record_header_init(RecordHeader& h, NodeKind kind) {
    std::memset(&h, 0, sizeof(h));
    h.magic[0] = 'T'; h.magic[1] = 'P'; h.magic[2] = 'R'; h.magic[3] = '1';
    h.kind = (u8)kind;
}

inline bool record_header_valid_magic(const RecordHeader& h) {
    return h.magic[0]=='T' && h.magic[1]=='P' && h.magic[2]=='R' && h.magic[3]=='1';
}
