#pragma once

// ============================================================
// logger.hpp -- Process-wide leveled logger
//
// Everything goes to stderr: stdout belongs to line mode output.
// The initial level comes from TREEPIPE_LOG (debug, info, warn,
// error); -v on the command line overrides it.
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdlib>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    LogLevel level() const { return level_; }

    // "debug", "info", "warn"/"warning", "error"; false if unknown
    static bool parse_level(const std::string& name, LogLevel& out) {
        if (name == "debug")                          out = LogLevel::DEBUG;
        else if (name == "info")                      out = LogLevel::INFO;
        else if (name == "warn" || name == "warning") out = LogLevel::WARN;
        else if (name == "error")                     out = LogLevel::ERR;
        else return false;
        return true;
    }

    // Duplicate every line into path (appending)
    bool set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void log(LogLevel lvl, const std::string& msg) {
        if (lvl < level_) return;
        std::string line = format_line(lvl, msg);
        std::lock_guard<std::mutex> lk(mutex_);
        std::cerr << line << "\n";
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO) {
        const char* env = std::getenv("TREEPIPE_LOG");
        LogLevel lvl;
        if (env && parse_level(env, lvl)) level_ = lvl;
    }

    std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] treepipe: " << msg;
        return ss.str();
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    std::mutex    mutex_;
    LogLevel      level_;
    std::ofstream file_;
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
