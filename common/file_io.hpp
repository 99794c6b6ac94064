#pragma once

// ============================================================
// file_io.hpp -- File I/O and node helpers
//
// Every function reports failure by throwing FilesystemError
// with the path and the OS error text.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- FileReader: positional reads of a file being sent ----
//
// Reads go through pread rather than a mapping, so a file that
// shrinks underneath us shows up as a short read, not a SIGBUS.
class FileReader {
public:
    explicit FileReader(const std::string& path);
    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    // Size when the file was opened
    u64 size() const { return size_; }

    // Read up to len bytes at offset. Returns fewer only at end of file.
    size_t read_at(u64 offset, void* buf, size_t len);

    void close();

private:
    std::string path_;
    u64         size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
#else
    int fd_{-1};
#endif
};

// ---- MmapWriter: write a file of known size via mmap ----
class MmapWriter {
public:
    MmapWriter() = default;
    ~MmapWriter();

    MmapWriter(const MmapWriter&) = delete;
    MmapWriter& operator=(const MmapWriter&) = delete;

    // Create/truncate path, size it, then mmap
    void open(const std::string& path, u64 size);

    // Like open(), but path must not exist yet; a symlink there is
    // never followed. Returns false if something already occupies path.
    bool create(const std::string& path, u64 size);

    // chmod through the open handle
    void set_mode(u32 mode);

    // Write data at given offset
    void write_at(u64 offset, const void* data, size_t len);

    // Flush to disk and close
    void close();

    // Unmap, close and delete the file; never throws
    void discard() noexcept;

    bool is_open() const;
    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    char*       data_{nullptr};
    u64         size_{0};
    std::string path_;

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif

    void release() noexcept;
    bool open_file(const std::string& path, u64 size, bool exclusive);
};

// ---- Node inspection ----

struct EntryStat {
    NodeKind kind{NodeKind::REGULAR};
    bool     supported{true};    // false: device, socket, ...
    u32      mode{0};            // permission bits
    u64      size{0};            // regular files only
    u64      mtime_ns{0};
    const char* type_name{""};   // for diagnostics
};

// Classify path without following a final symlink
EntryStat stat_entry(const std::string& path);

// Target of a symbolic link
std::string read_link(const std::string& path);

// ---- Node creation ----

// Create a named pipe with the given permission bits and mtime.
// Returns false when the platform has no named pipes.
bool make_fifo(const std::string& path, u32 mode, u64 mtime_ns);

// Returns false if path already exists; never replaces anything
bool make_symlink(const std::string& target, const std::string& path);

// Create path (and missing parents) as a directory
void make_dirs(const std::string& path);

// Rename, replacing an existing non-directory target
void rename_over(const std::string& from, const std::string& to);

// Fresh hidden name in target's directory for staging target,
// e.g. "dir/.name.partial-3f9c0a7e1b2d4c56"
std::string temp_sibling(const fs::path& target);

// ---- Metadata ----

// Set file modification time (nanoseconds since epoch)
void set_mtime(const std::string& path, u64 mtime_ns);

// chmod to mode & 07777
void set_mode(const std::string& path, u32 mode);

// Get file modification time as nanoseconds since epoch; 0 if not found
u64 get_mtime_ns(const std::string& path);

// ---- Paths ----

// Map an archive record name onto root_dir.
// "." maps to root_dir itself. Absolute names and ".." components
// throw ArchiveError.
fs::path proto_to_fspath(const fs::path& root_dir, const std::string& name);

// Record name for an entry: operand joined with the path relative to
// it, lexically normalised, '/' separated, no leading '/'
std::string record_name(const fs::path& operand, const fs::path& relative);

} // namespace file_io
