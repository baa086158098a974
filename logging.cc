#include "logging.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

namespace pjdir {

    namespace {

        std::atomic<LogLevel> g_level{LogLevel::INFO};
        std::mutex g_write_mutex;

        // Format: 2025-12-09 15:30:45.123
        std::string format_time() {
            auto now = std::chrono::system_clock::now();
            std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()) % 1000;
            std::tm tm;
            localtime_r(&seconds, &tm);
            char buf[32];
            snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
            return buf;
        }

    }  // namespace

    std::string LogLevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "trace";
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO: return "info";
            case LogLevel::WARN: return "warn";
            case LogLevel::ERROR: return "error";
            case LogLevel::CRITICAL: return "critical";
            case LogLevel::OFF: return "off";
            default: return "unknown";
        }
    }

    bool parse_log_level(const std::string& name, LogLevel* out) {
        for (int i = static_cast<int>(LogLevel::TRACE); i <= static_cast<int>(LogLevel::OFF); i++) {
            LogLevel level = static_cast<LogLevel>(i);
            if (LogLevelToString(level) == name) {
                *out = level;
                return true;
            }
        }
        return false;
    }

    void set_log_level(LogLevel level) {
        g_level.store(level, std::memory_order_relaxed);
    }

    LogLevel log_level() {
        return g_level.load(std::memory_order_relaxed);
    }

    void log_write(LogLevel level, const std::string& message) {
        std::string line = "[" + format_time() + "] [pjdir] [" + LogLevelToString(level) + "] " + message;
        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::clog << line << std::endl;
    }

}  // namespace pjdir
