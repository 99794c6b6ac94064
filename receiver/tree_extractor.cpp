// ============================================================
// tree_extractor.cpp -- Materialise an archive record stream
// ============================================================

#include "tree_extractor.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

// Owner bits kept on directories until the deferred pass
static constexpr u32 OWNER_RWX = 0700;

// Fresh staging names tried before giving up
static constexpr int TEMP_ATTEMPTS = 16;

// Run create(name) on fresh sibling names of path until one is free
template <typename Create>
static std::string stage_beside(const fs::path& path, Create create) {
    for (int attempt = 0; attempt < TEMP_ATTEMPTS; ++attempt) {
        std::string tmp = file_io::temp_sibling(path);
        if (create(tmp)) return tmp;
    }
    throw FilesystemError("no free staging name beside " + path.string());
}

TreeExtractor::TreeExtractor(const std::string& root)
    : root_(root.empty() ? "." : root)
    , buf_(PAYLOAD_SLICE)
{
    file_io::make_dirs(root_.string());
    created_dirs_.insert(root_.string());
}

void TreeExtractor::extract(ByteReader& in) {
    for (;;) {
        proto::Record rec = proto::read_record(in);
        if (rec.kind == NodeKind::END) break;

        fs::path path = file_io::proto_to_fspath(root_, rec.name);
        if (path == root_ && rec.kind != NodeKind::DIRECTORY) {
            throw ArchiveError(std::string(node_kind_str(rec.kind)) +
                               " record names the destination root: " + rec.name);
        }
        LOG_DEBUG(std::string(node_kind_str(rec.kind)) + " " + rec.name);

        switch (rec.kind) {
            case NodeKind::DIRECTORY: extract_directory(rec, path);   break;
            case NodeKind::SYMLINK:   extract_symlink(rec, path);     break;
            case NodeKind::REGULAR:   extract_regular(rec, path, in); break;
            case NodeKind::FIFO:      extract_fifo(rec, path);        break;
            case NodeKind::END:       break;
        }
        ++entries_;
    }

    apply_deferred();
}

void TreeExtractor::ensure_parent(const fs::path& path) {
    if (path == root_) return;
    fs::path parent = path.parent_path();
    std::string key = parent.string();
    if (created_dirs_.count(key)) return;

    // Refuse to write through a symlink extracted earlier in this run
    fs::path cur = root_;
    for (const auto& part : parent.lexically_relative(root_)) {
        if (part == ".") continue;
        cur /= part;
        if (created_links_.count(cur.string())) {
            throw ArchiveError("path through extracted symlink rejected: " + path.string());
        }
    }

    // Only call make_dirs once per unique parent directory
    file_io::make_dirs(key);
    created_dirs_.insert(std::move(key));
}

void TreeExtractor::clear_path(const fs::path& path) {
    std::error_code ec;
    fs::file_status st = fs::symlink_status(path, ec);
    if (ec || !fs::exists(st)) return;
    if (fs::is_directory(st)) {
        throw FilesystemError("cannot replace directory " + path.string());
    }
    fs::remove(path, ec);
    if (ec) throw FilesystemError("cannot remove " + path.string() + ": " + ec.message());
}

void TreeExtractor::extract_directory(const proto::Record& rec, const fs::path& path) {
    ensure_parent(path);

    std::error_code ec;
    fs::file_status st = fs::symlink_status(path, ec);

    if (fs::exists(st)) {
        if (!fs::is_directory(st)) {
            throw FilesystemError(path.string() + " exists and is not a directory");
        }
    } else {
        fs::create_directory(path, ec);
        if (ec) {
            throw FilesystemError("cannot create directory " + path.string() + ": " + ec.message());
        }
    }
    file_io::set_mode(path.string(), rec.mode | OWNER_RWX);
    created_dirs_.insert(path.string());

    deferred_.push_back(DeferredDir{path.string(), rec.mtime_ns, rec.mode});
}

void TreeExtractor::extract_symlink(const proto::Record& rec, const fs::path& path) {
    if (rec.link.empty()) {
        throw ArchiveError("symlink without target: " + rec.name);
    }
    ensure_parent(path);

    // Build under a fresh sibling name, then rename over whatever is there
    std::string tmp = stage_beside(path, [&](const std::string& name) {
        return file_io::make_symlink(rec.link, name);
    });
    try {
        file_io::rename_over(tmp, path.string());
    } catch (const FilesystemError&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
    created_links_.insert(path.string());
}

void TreeExtractor::extract_regular(const proto::Record& rec, const fs::path& path, ByteReader& in) {
    ensure_parent(path);

    file_io::MmapWriter writer;
    std::string tmp = stage_beside(path, [&](const std::string& name) {
        return writer.create(name, rec.size);
    });

    u64 written = 0;
    try {
        while (written < rec.size) {
            size_t want = (size_t)std::min<u64>(rec.size - written, buf_.size());
            size_t got  = read_full(in, buf_.data(), want);
            writer.write_at(written, buf_.data(), got);
            written += got;
            if (got < want) break;
        }
        if (written != rec.size) {
            throw FilesystemError("mis-write of " + rec.name + ": " + std::to_string(written) +
                                  " written, expected: " + std::to_string(rec.size));
        }
        writer.set_mode(rec.mode);
        writer.close();
    } catch (...) {
        writer.discard();
        throw;
    }

    try {
        file_io::rename_over(tmp, path.string());
    } catch (const FilesystemError&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
    file_io::set_mtime(path.string(), rec.mtime_ns);
    payload_bytes_ += written;
}

void TreeExtractor::extract_fifo(const proto::Record& rec, const fs::path& path) {
    ensure_parent(path);
    clear_path(path);

    if (file_io::make_fifo(path.string(), rec.mode, rec.mtime_ns)) return;

    LOG_WARN("named pipes unsupported here, writing " + path.string() + " as an empty file");
    file_io::MmapWriter writer;
    writer.open(path.string(), 0);
    writer.close();
    file_io::set_mode(path.string(), rec.mode);
    file_io::set_mtime(path.string(), rec.mtime_ns);
}

void TreeExtractor::apply_deferred() {
    // Reverse arrival order: children before the parents holding them
    for (auto it = deferred_.rbegin(); it != deferred_.rend(); ++it) {
        file_io::set_mode(it->path, it->mode);
        file_io::set_mtime(it->path, it->mtime_ns);
    }
    LOG_DEBUG("applied metadata to " + std::to_string(deferred_.size()) + " directories");
}
