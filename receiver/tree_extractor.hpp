#pragma once

// ============================================================
// tree_extractor.hpp -- Materialise an archive record stream
//
// Records are applied strictly in arrival order under the
// destination root. Directory modes and mtimes are deferred:
// while extracting, a directory keeps owner rwx so its children
// can be created, and its final mode and mtime are applied after
// the END record, deepest-last-seen first.
// ============================================================

#include "../common/platform.hpp"
#include "../common/stream.hpp"
#include "../common/record_io.hpp"
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

// Directory whose final metadata is applied after the stream ends
struct DeferredDir {
    std::string path;
    u64         mtime_ns;
    u32         mode;
};

class TreeExtractor {
public:
    // Creates root if it does not exist
    explicit TreeExtractor(const std::string& root);

    TreeExtractor(const TreeExtractor&) = delete;
    TreeExtractor& operator=(const TreeExtractor&) = delete;

    // Read records until END, then apply the deferred directory list.
    // Throws ArchiveError / FilesystemError; nothing is retried.
    void extract(ByteReader& in);

    u64 entries() const { return entries_; }
    u64 payload_bytes() const { return payload_bytes_; }
    const std::vector<DeferredDir>& deferred() const { return deferred_; }

private:
    std::filesystem::path           root_;
    std::vector<DeferredDir>        deferred_;
    std::unordered_set<std::string> created_dirs_;
    std::unordered_set<std::string> created_links_;
    std::vector<u8>                 buf_;
    u64 entries_{0};
    u64 payload_bytes_{0};

    void ensure_parent(const std::filesystem::path& path);

    void extract_directory(const proto::Record& rec, const std::filesystem::path& path);
    void extract_symlink(const proto::Record& rec, const std::filesystem::path& path);
    void extract_regular(const proto::Record& rec, const std::filesystem::path& path, ByteReader& in);
    void extract_fifo(const proto::Record& rec, const std::filesystem::path& path);

    // Remove a non-directory occupying path
    void clear_path(const std::filesystem::path& path);

    void apply_deferred();
};
