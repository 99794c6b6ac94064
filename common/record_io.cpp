// ============================================================
// record_io.cpp -- Archive record read/write over a byte stream
// ============================================================

#include "record_io.hpp"
#include "protocol_io.hpp"
#include "errors.hpp"

namespace proto {

void write_record(ByteWriter& w, const Record& rec) {
    if (rec.name.empty() || rec.name.size() > MAX_NAME_LEN) {
        throw ArchiveError("record name length " + std::to_string(rec.name.size()) +
                           " out of range: " + rec.name.substr(0, 64));
    }
    if (rec.link.size() > MAX_LINK_LEN) {
        throw ArchiveError("link target of " + rec.name + " exceeds " +
                           std::to_string(MAX_LINK_LEN) + " bytes");
    }

    RecordHeader h;
    record_header_init(h, rec.kind);
    h.mode     = rec.mode & MODE_MASK;
    h.size     = rec.kind == NodeKind::REGULAR ? rec.size : 0;
    h.mtime_ns = rec.mtime_ns;
    h.name_len = (u16)rec.name.size();
    h.link_len = (u16)rec.link.size();
    encode_record_header(h);

    w.write(&h, sizeof(h));
    w.write(rec.name.data(), rec.name.size());
    if (!rec.link.empty()) w.write(rec.link.data(), rec.link.size());
}

void write_end(ByteWriter& w) {
    RecordHeader h;
    record_header_init(h, NodeKind::END);
    w.write(&h, sizeof(h));
}

static void read_exact(ByteReader& r, void* buf, size_t len, const char* what) {
    size_t got = read_full(r, buf, len);
    if (got != len) {
        throw ArchiveError(std::string("archive truncated in ") + what + ": " +
                           std::to_string(got) + " of " + std::to_string(len) + " bytes");
    }
}

Record read_record(ByteReader& r) {
    RecordHeader h;
    size_t got = read_full(r, &h, sizeof(h));
    if (got == 0) {
        throw ArchiveError("archive truncated: stream ended without end record");
    }
    if (got != sizeof(h)) {
        throw ArchiveError("archive truncated in record header: " +
                           std::to_string(got) + " of " + std::to_string(sizeof(h)) + " bytes");
    }
    if (!record_header_valid_magic(h)) {
        throw ArchiveError("bad record magic");
    }
    if (!node_kind_valid(h.kind)) {
        throw ArchiveError("unknown record kind " + std::to_string(h.kind));
    }
    decode_record_header(h);

    Record rec;
    rec.kind     = (NodeKind)h.kind;
    rec.mode     = h.mode & MODE_MASK;
    rec.size     = rec.kind == NodeKind::REGULAR ? h.size : 0;
    rec.mtime_ns = h.mtime_ns;
    if (rec.kind == NodeKind::END) return rec;

    if (h.name_len == 0 || h.name_len > MAX_NAME_LEN) {
        throw ArchiveError("record name length " + std::to_string(h.name_len) + " out of range");
    }
    if (h.link_len > MAX_LINK_LEN) {
        throw ArchiveError("link target length " + std::to_string(h.link_len) + " out of range");
    }
    if (rec.kind != NodeKind::SYMLINK && h.link_len != 0) {
        throw ArchiveError("link target on non-symlink record");
    }
    if (rec.kind != NodeKind::REGULAR && h.size != 0) {
        throw ArchiveError("payload on " + std::string(node_kind_str(rec.kind)) + " record");
    }

    rec.name.resize(h.name_len);
    read_exact(r, &rec.name[0], rec.name.size(), "record name");
    if (rec.name.find('\0') != std::string::npos) {
        throw ArchiveError("NUL byte in record name");
    }
    if (h.link_len > 0) {
        rec.link.resize(h.link_len);
        read_exact(r, &rec.link[0], rec.link.size(), "link target");
    }
    return rec;
}

} // namespace proto
