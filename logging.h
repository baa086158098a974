// Process-wide logging for the directory server.

#ifndef PJDIR_LOGGING_H
#define PJDIR_LOGGING_H

#include <sstream>
#include <string>

namespace pjdir {

    enum class LogLevel {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL,
        OFF
    };

    std::string LogLevelToString(LogLevel level);

    // Parses "trace", "debug", ... "off". Returns false on an unknown name.
    bool parse_log_level(const std::string& name, LogLevel* out);

    void set_log_level(LogLevel level);
    LogLevel log_level();

    inline bool log_enabled(LogLevel level) {
        return level >= log_level() && level != LogLevel::OFF;
    }

    // Writes one timestamped line to std::clog.
    void log_write(LogLevel level, const std::string& message);

}  // namespace pjdir

#define PJDIR_LOG(level, expr)                                  \
    do {                                                        \
        if (::pjdir::log_enabled(level)) {                      \
            std::ostringstream pjdir_log_stream_;               \
            pjdir_log_stream_ << expr;                          \
            ::pjdir::log_write(level, pjdir_log_stream_.str()); \
        }                                                       \
    } while (0)

#define PJDIR_LOG_TRACE(expr) PJDIR_LOG(::pjdir::LogLevel::TRACE, expr)
#define PJDIR_LOG_DEBUG(expr) PJDIR_LOG(::pjdir::LogLevel::DEBUG, expr)
#define PJDIR_LOG_INFO(expr) PJDIR_LOG(::pjdir::LogLevel::INFO, expr)
#define PJDIR_LOG_WARN(expr) PJDIR_LOG(::pjdir::LogLevel::WARN, expr)
#define PJDIR_LOG_ERROR(expr) PJDIR_LOG(::pjdir::LogLevel::ERROR, expr)
#define PJDIR_LOG_CRITICAL(expr) PJDIR_LOG(::pjdir::LogLevel::CRITICAL, expr)

#endif  // PJDIR_LOGGING_H
