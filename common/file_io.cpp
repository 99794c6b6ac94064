// ============================================================
// file_io.cpp -- File I/O and node helpers
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <random>
#include <string>
#include <system_error>

#ifndef _WIN32
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#  include <time.h>
#endif

using namespace file_io;

static FilesystemError fs_error(const std::string& what, const std::string& path, int err) {
    return FilesystemError(what + " " + path + ": " + platform::errno_str(err));
}

#ifdef _WIN32
static FilesystemError win_error(const std::string& what, const std::string& path) {
    return FilesystemError(what + " " + path + ": " + socket_error_str((int)GetLastError()));
}

// FILETIME: 100-ns intervals since 1601-01-01
static constexpr u64 FILETIME_UNIX_EPOCH = 116444736000000000ULL;
#endif

// ============================================================
// FileReader
// ============================================================

FileReader::FileReader(const std::string& path)
    : path_(path)
{
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL |
                               FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw win_error("cannot open", path);
    }
    LARGE_INTEGER sz{};
    if (!GetFileSizeEx(file_handle_, &sz)) {
        FilesystemError e = win_error("cannot size", path);
        close();
        throw e;
    }
    size_ = (u64)sz.QuadPart;
#else
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw fs_error("cannot open", path, errno);
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        int err = errno;
        close();
        throw fs_error("fstat", path, err);
    }
    size_ = (u64)st.st_size;
#  ifdef POSIX_FADV_SEQUENTIAL
    posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
#  endif
#endif
}

FileReader::~FileReader() {
    close();
}

size_t FileReader::read_at(u64 offset, void* buf, size_t len) {
    u8* p = static_cast<u8*>(buf);
    size_t got = 0;
#ifdef _WIN32
    while (got < len) {
        OVERLAPPED ov{};
        u64 pos = offset + got;
        ov.Offset     = (DWORD)(pos & 0xFFFFFFFF);
        ov.OffsetHigh = (DWORD)(pos >> 32);
        DWORD want = (DWORD)std::min<size_t>(len - got, 1u << 30);
        DWORD n = 0;
        if (!ReadFile(file_handle_, p + got, want, &n, &ov)) {
            if (GetLastError() == ERROR_HANDLE_EOF) break;
            throw win_error("cannot read", path_);
        }
        if (n == 0) break;
        got += n;
    }
#else
    while (got < len) {
        ssize_t n = ::pread(fd_, p + got, len - got, (off_t)(offset + got));
        if (n < 0) {
            if (interrupted(errno)) continue;
            throw fs_error("cannot read", path_, errno);
        }
        if (n == 0) break;
        got += (size_t)n;
    }
#endif
    return got;
}

void FileReader::close() {
#ifdef _WIN32
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
}

// ============================================================
// MmapWriter
// ============================================================

MmapWriter::~MmapWriter() {
    release();
}

bool MmapWriter::is_open() const {
#ifdef _WIN32
    return file_handle_ != INVALID_HANDLE_VALUE;
#else
    return fd_ >= 0;
#endif
}

void MmapWriter::open(const std::string& file_path, u64 size) {
    open_file(file_path, size, false);
}

bool MmapWriter::create(const std::string& file_path, u64 size) {
    return open_file(file_path, size, true);
}

bool MmapWriter::open_file(const std::string& file_path, u64 size, bool exclusive) {
    path_ = file_path;
    size_ = size;

#ifdef _WIN32
    file_handle_ = CreateFileA(file_path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr,
                               exclusive ? CREATE_NEW : CREATE_ALWAYS,
                               FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        DWORD err = GetLastError();
        if (exclusive && (err == ERROR_FILE_EXISTS || err == ERROR_ALREADY_EXISTS)) {
            path_.clear();
            size_ = 0;
            return false;
        }
        throw win_error("cannot create", file_path);
    }

    if (size == 0) {
        data_ = nullptr;
        return true;
    }

    DWORD hi = (DWORD)(size >> 32);
    DWORD lo = (DWORD)(size & 0xFFFFFFFF);
    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READWRITE, hi, lo, nullptr);
    if (!map_handle_) {
        FilesystemError e = win_error("CreateFileMapping(write)", file_path);
        discard();
        throw e;
    }

    data_ = static_cast<char*>(MapViewOfFile(map_handle_, FILE_MAP_WRITE, 0, 0, 0));
    if (!data_) {
        FilesystemError e = win_error("MapViewOfFile(write)", file_path);
        discard();
        throw e;
    }
#else
    // Owner-only until the final mode is applied
    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    flags |= exclusive ? (O_EXCL | O_NOFOLLOW) : O_TRUNC;
    fd_ = ::open(file_path.c_str(), flags, 0600);
    if (fd_ < 0) {
        if (exclusive && errno == EEXIST) {
            path_.clear();
            size_ = 0;
            return false;
        }
        throw fs_error("cannot create", file_path, errno);
    }

    if (size > 0) {
        int rc = posix_fallocate(fd_, 0, (off_t)size);
        if (rc != 0 && ftruncate(fd_, (off_t)size) != 0) {
            int err = errno;
            discard();
            throw fs_error("cannot size", file_path, err);
        }

        void* p = mmap(nullptr, (size_t)size, PROT_WRITE, MAP_SHARED, fd_, 0);
        if (p == MAP_FAILED) {
            int err = errno;
            discard();
            throw fs_error("mmap(write)", file_path, err);
        }
        madvise(p, (size_t)size, MADV_SEQUENTIAL);
        data_ = static_cast<char*>(p);
    } else {
        data_ = nullptr;
    }
#endif
    return true;
}

void MmapWriter::set_mode(u32 mode) {
#ifdef _WIN32
    file_io::set_mode(path_, mode);
#else
    if (fd_ < 0) throw FilesystemError("chmod of closed file " + path_);
    if (::fchmod(fd_, (mode_t)(mode & MODE_MASK)) != 0) {
        throw fs_error("cannot chmod", path_, errno);
    }
#endif
}

void MmapWriter::write_at(u64 offset, const void* data, size_t len) {
    if (len == 0) return;
    if (!data_ || offset + len > size_) {
        throw FilesystemError("write past declared size of " + path_ + ": offset " +
                              std::to_string(offset) + " + " + std::to_string(len) +
                              " > " + std::to_string(size_));
    }
    std::memcpy(data_ + offset, data, len);
}

void MmapWriter::close() {
#ifdef _WIN32
    bool ok = true;
    if (data_) {
        ok = FlushViewOfFile(data_, 0) != 0;
        UnmapViewOfFile(data_);
        data_ = nullptr;
    }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) {
        ok = (CloseHandle(file_handle_) != 0) && ok;
        file_handle_ = INVALID_HANDLE_VALUE;
    }
    if (!ok) throw win_error("cannot finish", path_);
#else
    int err = 0;
    if (data_ && size_ > 0) {
        if (msync(data_, (size_t)size_, MS_SYNC) != 0) err = errno;
        munmap(data_, (size_t)size_);
        data_ = nullptr;
    }
    if (fd_ >= 0) {
        if (::close(fd_) != 0 && err == 0) err = errno;
        fd_ = -1;
    }
    if (err != 0) throw fs_error("cannot finish", path_, err);
#endif
    size_ = 0;
}

void MmapWriter::release() noexcept {
#ifdef _WIN32
    if (data_) { UnmapViewOfFile(data_); data_ = nullptr; }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (data_ && size_ > 0) { munmap(data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

void MmapWriter::discard() noexcept {
    release();
    if (!path_.empty()) {
        std::error_code ec;
        fs::remove(path_, ec);
    }
}

// ============================================================
// Node inspection
// ============================================================

EntryStat file_io::stat_entry(const std::string& path) {
    EntryStat es;
#ifdef _WIN32
    std::error_code ec;
    fs::file_status st = fs::symlink_status(path, ec);
    if (ec) throw FilesystemError("cannot stat " + path + ": " + ec.message());
    es.mode     = (u32)st.permissions() & MODE_MASK;
    es.mtime_ns = get_mtime_ns(path);
    switch (st.type()) {
        case fs::file_type::regular:
            es.kind = NodeKind::REGULAR;
            es.size = (u64)fs::file_size(path, ec);
            if (ec) throw FilesystemError("cannot size " + path + ": " + ec.message());
            es.type_name = "file";
            break;
        case fs::file_type::directory: es.kind = NodeKind::DIRECTORY; es.type_name = "dir"; break;
        case fs::file_type::symlink:   es.kind = NodeKind::SYMLINK;   es.type_name = "symlink"; break;
        default: es.supported = false; es.type_name = "special file"; break;
    }
#else
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        throw fs_error("cannot stat", path, errno);
    }
    es.mode = (u32)st.st_mode & MODE_MASK;
#  if defined(__APPLE__)
    es.mtime_ns = (u64)st.st_mtimespec.tv_sec * 1000000000ULL + (u64)st.st_mtimespec.tv_nsec;
#  else
    es.mtime_ns = (u64)st.st_mtim.tv_sec * 1000000000ULL + (u64)st.st_mtim.tv_nsec;
#  endif

    if (S_ISREG(st.st_mode)) {
        es.kind = NodeKind::REGULAR;
        es.size = (u64)st.st_size;
        es.type_name = "file";
    } else if (S_ISDIR(st.st_mode)) {
        es.kind = NodeKind::DIRECTORY;
        es.type_name = "dir";
    } else if (S_ISLNK(st.st_mode)) {
        es.kind = NodeKind::SYMLINK;
        es.type_name = "symlink";
    } else if (S_ISFIFO(st.st_mode)) {
        es.kind = NodeKind::FIFO;
        es.type_name = "fifo";
    } else {
        es.supported = false;
        if (S_ISSOCK(st.st_mode))      es.type_name = "socket";
        else if (S_ISBLK(st.st_mode))  es.type_name = "block device";
        else if (S_ISCHR(st.st_mode))  es.type_name = "character device";
        else                           es.type_name = "special file";
    }
#endif
    return es;
}

std::string file_io::read_link(const std::string& path) {
    std::error_code ec;
    fs::path target = fs::read_symlink(path, ec);
    if (ec) throw FilesystemError("cannot read link " + path + ": " + ec.message());
    return target.string();
}

// ============================================================
// Node creation
// ============================================================

bool file_io::make_fifo(const std::string& path, u32 mode, u64 mtime_ns) {
#ifdef _WIN32
    (void)path; (void)mode; (void)mtime_ns;
    return false;
#else
    if (::mkfifo(path.c_str(), (mode_t)(mode & MODE_MASK)) != 0) {
        throw fs_error("mkfifo", path, errno);
    }
    // mkfifo is subject to the umask
    set_mode(path, mode);
    set_mtime(path, mtime_ns);
    return true;
#endif
}

bool file_io::make_symlink(const std::string& target, const std::string& path) {
    std::error_code ec;
    fs::create_symlink(target, path, ec);
    if (ec == std::errc::file_exists) return false;
    if (ec) throw FilesystemError("cannot create symlink " + path + ": " + ec.message());
    return true;
}

void file_io::make_dirs(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) throw FilesystemError("cannot create directory " + path + ": " + ec.message());
}

void file_io::rename_over(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) throw FilesystemError("cannot rename " + from + " to " + to + ": " + ec.message());
}

std::string file_io::temp_sibling(const fs::path& target) {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    char suffix[17];
    std::snprintf(suffix, sizeof(suffix), "%016llx", (unsigned long long)gen());

    // Leave room for the prefix and suffix within NAME_MAX
    std::string base = target.filename().string().substr(0, 200);
    return (target.parent_path() / ("." + base + ".partial-" + suffix)).string();
}

// ============================================================
// Metadata
// ============================================================

void file_io::set_mtime(const std::string& path, u64 mtime_ns) {
#ifdef _WIN32
    HANDLE h = CreateFileA(path.c_str(), FILE_WRITE_ATTRIBUTES, 0, nullptr,
                           OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr);
    if (h == INVALID_HANDLE_VALUE) throw win_error("cannot open", path);
    u64 ft_val = mtime_ns / 100 + FILETIME_UNIX_EPOCH;
    FILETIME ft;
    ft.dwLowDateTime  = (DWORD)(ft_val & 0xFFFFFFFF);
    ft.dwHighDateTime = (DWORD)(ft_val >> 32);
    bool ok = SetFileTime(h, nullptr, &ft, &ft) != 0;
    CloseHandle(h);
    if (!ok) throw win_error("cannot set mtime of", path);
#else
    struct timespec ts[2];
    ts[0].tv_sec  = (time_t)(mtime_ns / 1000000000ULL);
    ts[0].tv_nsec = (long)(mtime_ns % 1000000000ULL);
    ts[1] = ts[0];
    if (utimensat(AT_FDCWD, path.c_str(), ts, 0) != 0) {
        throw fs_error("cannot set mtime of", path, errno);
    }
#endif
}

void file_io::set_mode(const std::string& path, u32 mode) {
    std::error_code ec;
    fs::permissions(path, (fs::perms)(mode & MODE_MASK), fs::perm_options::replace, ec);
    if (ec) throw FilesystemError("cannot chmod " + path + ": " + ec.message());
}

u64 file_io::get_mtime_ns(const std::string& path) {
#ifdef _WIN32
    WIN32_FILE_ATTRIBUTE_DATA info{};
    if (!GetFileAttributesExA(path.c_str(), GetFileExInfoStandard, &info)) return 0;
    u64 ft = ((u64)info.ftLastWriteTime.dwHighDateTime << 32) | info.ftLastWriteTime.dwLowDateTime;
    if (ft < FILETIME_UNIX_EPOCH) return 0;
    return (ft - FILETIME_UNIX_EPOCH) * 100ULL;
#else
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
#  if defined(__APPLE__)
    return (u64)st.st_mtimespec.tv_sec * 1000000000ULL + (u64)st.st_mtimespec.tv_nsec;
#  else
    return (u64)st.st_mtim.tv_sec * 1000000000ULL + (u64)st.st_mtim.tv_nsec;
#  endif
#endif
}

// ============================================================
// Paths
// ============================================================

fs::path file_io::proto_to_fspath(const fs::path& root_dir, const std::string& name) {
    if (name.empty()) {
        throw ArchiveError("empty record name");
    }
    if (name[0] == '/' || name[0] == '\\' || fs::path(name).has_root_name()) {
        throw ArchiveError("absolute path rejected: " + name);
    }

    fs::path rel;
    size_t start = 0;
    while (start <= name.size()) {
        size_t end = name.find('/', start);
        if (end == std::string::npos) end = name.size();
        std::string part = name.substr(start, end - start);
        start = end + 1;

        if (part.empty() || part == ".") continue;
        if (part == "..") {
            throw ArchiveError("path traversal rejected: " + name);
        }
        if (part.find('\\') != std::string::npos) {
            throw ArchiveError("backslash in record name rejected: " + name);
        }
        rel /= part;
    }

    // "." and "./" name the root itself
    if (rel.empty()) return root_dir;
    return root_dir / rel;
}

std::string file_io::record_name(const fs::path& operand, const fs::path& relative) {
    fs::path joined = relative.empty() ? operand : operand / relative;
    std::string s = joined.lexically_normal().generic_string();

    while (s.size() > 1 && s.back() == '/') s.pop_back();
    size_t lead = s.find_first_not_of('/');
    if (lead == std::string::npos) return ".";
    return s.substr(lead);
}
