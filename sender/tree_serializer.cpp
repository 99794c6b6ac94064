// ============================================================
// tree_serializer.cpp -- Emit archive records for send operands
// ============================================================

#include "tree_serializer.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/record_io.hpp"
#include <algorithm>
#include <memory>

TreeSerializer::TreeSerializer(ByteWriter& out)
    : out_(out)
    , buf_(PAYLOAD_SLICE) {}

void TreeSerializer::add_operand(const std::string& operand) {
    TreeWalker walker(operand);
    walker.walk([this](const WalkEntry& e) { add_entry(e); });
    skipped_ += walker.skipped();
}

void TreeSerializer::add_entry(const WalkEntry& entry) {
    if (finished_) throw ArchiveError("entry after end of archive: " + entry.name);

    const file_io::EntryStat& st = entry.stat;
    if (!st.supported) {
        LOG_WARN("skipping unsupported " + std::string(st.type_name) + ": " +
                 entry.abs_path.string());
        ++skipped_;
        return;
    }

    if (st.kind == NodeKind::REGULAR) {
        send_regular(entry);
        return;
    }

    proto::Record rec;
    rec.kind     = st.kind;
    rec.name     = entry.name;
    rec.mode     = st.mode;
    rec.mtime_ns = st.mtime_ns;
    if (st.kind == NodeKind::SYMLINK) {
        rec.link = file_io::read_link(entry.abs_path.string());
    }

    proto::write_record(out_, rec);
    ++entries_;
    LOG_DEBUG(std::string(node_kind_str(st.kind)) + " " + rec.name +
              (rec.link.empty() ? "" : " -> " + rec.link));
}

void TreeSerializer::send_regular(const WalkEntry& entry) {
    const file_io::EntryStat& st = entry.stat;

    std::unique_ptr<file_io::FileReader> reader;
    try {
        reader = std::make_unique<file_io::FileReader>(entry.abs_path.string());
    } catch (const FilesystemError& e) {
        // Unreadable files are skipped like unreadable directories
        LOG_WARN(std::string("skipping: ") + e.what());
        ++skipped_;
        return;
    }

    if (reader->size() != st.size) {
        throw FilesystemError(entry.abs_path.string() + " changed during send: " +
                              std::to_string(reader->size()) + " bytes, header declared " +
                              std::to_string(st.size));
    }

    proto::Record rec;
    rec.kind     = NodeKind::REGULAR;
    rec.name     = entry.name;
    rec.mode     = st.mode;
    rec.size     = st.size;
    rec.mtime_ns = st.mtime_ns;
    proto::write_record(out_, rec);

    u64 offset = 0;
    while (offset < st.size) {
        size_t want = (size_t)std::min<u64>(st.size - offset, buf_.size());
        size_t got  = reader->read_at(offset, buf_.data(), want);
        if (got < want) {
            throw FilesystemError(entry.abs_path.string() + " changed during send: ended at " +
                                  std::to_string(offset + got) + " bytes, header declared " +
                                  std::to_string(st.size));
        }
        out_.write(buf_.data(), got);
        offset += got;
    }
    reader->close();

    ++entries_;
    payload_bytes_ += st.size;
    LOG_DEBUG("file " + rec.name + " (" + std::to_string(st.size) + " bytes)");
}

void TreeSerializer::finish() {
    if (finished_) return;
    proto::write_end(out_);
    finished_ = true;
}
