#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <iomanip>

namespace utils {

// Current time in milliseconds since epoch
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
        return ss.str();
    } else if (bytes < 1024ULL * 1024 * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
        return ss.str();
    } else {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
        return ss.str();
    }
}

// Format speed as "X.XX MB/s"
inline std::string format_speed(double bytes_per_sec) {
    std::ostringstream ss;
    if (bytes_per_sec < 1024.0) {
        ss << std::fixed << std::setprecision(1) << bytes_per_sec << " B/s";
    } else if (bytes_per_sec < 1024.0 * 1024) {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / 1024.0 << " KB/s";
    } else if (bytes_per_sec < 1024.0 * 1024 * 1024) {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / (1024.0 * 1024) << " MB/s";
    } else {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / (1024.0 * 1024 * 1024) << " GB/s";
    }
    return ss.str();
}

// Format a millisecond duration as "1h 23m 45s", "45s" or "0.42s"
inline std::string format_duration_ms(u64 ms) {
    if (ms < 10000) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)ms / 1000.0 << "s";
        return ss.str();
    }
    u64 seconds = ms / 1000;
    if (seconds < 60) return std::to_string(seconds) + "s";
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    }
    return std::to_string(seconds / 3600) + "h " +
           std::to_string((seconds % 3600) / 60) + "m " +
           std::to_string(seconds % 60) + "s";
}

// One-line summary: "12 entries, 3.40 MB in 0.52s (6.54 MB/s)"
inline std::string format_summary(u64 entries, u64 bytes, u64 elapsed_ms) {
    double secs = elapsed_ms > 0 ? (double)elapsed_ms / 1000.0 : 0.001;
    return std::to_string(entries) + " entries, " + format_bytes(bytes) +
           " in " + format_duration_ms(elapsed_ms) +
           " (" + format_speed((double)bytes / secs) + ")";
}

// Split "host:port", "[v6]:port" or ":port".
// Returns false if the port is missing or above 65535; port 0 is
// left for the caller to accept (ephemeral listen) or reject.
inline bool split_host_port(const std::string& addr, std::string& host, u16& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos) return false;

    host = addr.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    std::string port_str = addr.substr(colon + 1);
    if (port_str.empty()) return false;
    for (char c : port_str) {
        if (c < '0' || c > '9') return false;
    }
    if (port_str.size() > 5) return false;
    int p = std::atoi(port_str.c_str());
    if (p > 65535) return false;
    port = (u16)p;
    return true;
}

} // namespace utils
