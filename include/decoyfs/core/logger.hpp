/*
 * decoyfs - Logger
 *
 * Process-wide leveled logger writing to stderr (or a configured stream).
 */
#ifndef decoyfs_CORE_LOGGER_HPP
#define decoyfs_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>
#include <atomic>

namespace decoyfs {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error". Unknown names yield INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;

    // Redirect output (NULL restores stderr). Colors are only emitted on a tty.
    void set_output(FILE* out);
    
    bool enabled(LogLevel level) const { return level >= level_; }

    // printf-style; file/line/func are shown only at DEBUG level
    void write(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 6, 7)));

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    std::atomic<LogLevel> level_;
    FILE* out_;
    std::mutex mutex_;  // sessions log from several threads
};

// Arguments are not evaluated when the level is filtered out
#define DECOYFS_LOG(lvl, ...) \
    do { \
        decoyfs::Logger& decoyfs_logger_ = decoyfs::Logger::instance(); \
        if (decoyfs_logger_.enabled(lvl)) \
            decoyfs_logger_.write(lvl, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...) DECOYFS_LOG(decoyfs::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  DECOYFS_LOG(decoyfs::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  DECOYFS_LOG(decoyfs::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) DECOYFS_LOG(decoyfs::LogLevel::ERROR, __VA_ARGS__)

} // namespace decoyfs

#endif // decoyfs_CORE_LOGGER_HPP
