#pragma once

// ============================================================
// tree_walker.hpp -- Pre-order walk of one send operand
//
// Every directory is visited before its contents. Symlinks are
// reported, never followed. Entries that cannot be read (vanished,
// permission denied) are logged and skipped; only a missing
// operand is fatal.
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include <functional>
#include <string>
#include <filesystem>

// One visited node
struct WalkEntry {
    std::filesystem::path abs_path;   // path to open / lstat
    std::string           name;       // archive record name
    file_io::EntryStat    stat;
};

class TreeWalker {
public:
    using Visitor = std::function<void(const WalkEntry&)>;

    explicit TreeWalker(const std::string& operand);

    // Visit the operand and, if it is a directory, everything below it.
    // Throws FilesystemError if the operand itself cannot be stat'ed.
    void walk(const Visitor& visit);

    u64 skipped() const { return skipped_; }

private:
    std::filesystem::path operand_;
    u64 skipped_{0};

    void walk_dir(const std::filesystem::path& abs, const std::filesystem::path& rel,
                  const Visitor& visit);
};
