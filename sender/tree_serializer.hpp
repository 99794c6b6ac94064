#pragma once

// ============================================================
// tree_serializer.hpp -- Emit archive records for send operands
//
// Usage:
//   TreeSerializer ser(writer);
//   for (auto& op : operands) ser.add_operand(op);
//   ser.finish();          // END record
// ============================================================

#include "../common/platform.hpp"
#include "../common/stream.hpp"
#include "../common/file_io.hpp"
#include "tree_walker.hpp"
#include <string>
#include <vector>

class TreeSerializer {
public:
    explicit TreeSerializer(ByteWriter& out);

    TreeSerializer(const TreeSerializer&) = delete;
    TreeSerializer& operator=(const TreeSerializer&) = delete;

    // Walk one operand and emit a record for every supported node
    void add_operand(const std::string& operand);

    // Emit a single node. Unsupported nodes are skipped with a warning.
    // A regular file whose size no longer matches entry.stat.size, or
    // that shrinks while its payload is read, aborts with FilesystemError.
    void add_entry(const WalkEntry& entry);

    // Write the END record
    void finish();

    u64 entries() const { return entries_; }
    u64 skipped() const { return skipped_; }
    u64 payload_bytes() const { return payload_bytes_; }

private:
    ByteWriter& out_;
    u64 entries_{0};
    u64 skipped_{0};
    u64 payload_bytes_{0};
    bool finished_{false};
    std::vector<u8> buf_;

    void send_regular(const WalkEntry& entry);
};
