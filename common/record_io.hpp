#pragma once

// ============================================================
// record_io.hpp -- Archive record read/write over a byte stream
//
// A record is a RecordHeader followed by the name, the link
// target and (REGULAR only) exactly `size` payload bytes. The
// payload is written/read by the caller right after the header.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "stream.hpp"
#include <string>

namespace proto {

struct Record {
    NodeKind    kind{NodeKind::END};
    std::string name;
    std::string link;     // SYMLINK target
    u32         mode{0};
    u64         size{0};  // REGULAR payload length
    u64         mtime_ns{0};
};

// Header + name + link. Throws ArchiveError for oversized names.
void write_record(ByteWriter& w, const Record& rec);

// END record terminating the archive
void write_end(ByteWriter& w);

// Next record header + name + link.
// Throws ArchiveError on a malformed header or when the stream
// ends before an END record.
Record read_record(ByteReader& r);

} // namespace proto
