#pragma once

// Shared fixtures for the treepipe test suites

#include "../common/platform.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction
class ScratchDir {
public:
    ScratchDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("treepipe_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        // Read-only directories left by a test must be writable to be removed
        for (auto it = fs::recursive_directory_iterator(path_, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_directory(ec) && !it->is_symlink(ec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
            }
        }
        fs::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f.write(content.data(), (std::streamsize)content.size());
}

inline std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Deterministic pseudo-random bytes
inline std::vector<u8> pattern_bytes(size_t n, u32 seed = 1) {
    std::vector<u8> v(n);
    std::mt19937 gen(seed);
    for (auto& b : v) b = (u8)(gen() & 0xFF);
    return v;
}

inline std::string pattern_string(size_t n, u32 seed = 1) {
    auto v = pattern_bytes(n, seed);
    return std::string(v.begin(), v.end());
}
