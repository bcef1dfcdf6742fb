/*
 * docpipe C++17 - Logger
 *
 * Leveled stderr logger shared by every pipeline stage. Jobs log from
 * worker threads, so emission is serialized.
 */
#ifndef docpipe_CORE_LOGGER_HPP
#define docpipe_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <mutex>
#include <atomic>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace docpipe {

#ifdef __GNUC__
#  define DOCPIPE_LOGGER_API __attribute__((visibility("default")))
#  define DOCPIPE_PRINTF_FMT(a, b) __attribute__((format(printf, a, b)))
#else
#  define DOCPIPE_LOGGER_API
#  define DOCPIPE_PRINTF_FMT(a, b)
#endif

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error"; anything else yields INFO
LogLevel parse_log_level(const std::string& name);

class DOCPIPE_LOGGER_API Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void debug(const char* file, int line, const char* func, const char* fmt, ...) DOCPIPE_PRINTF_FMT(5, 6);
    void info(const char* file, int line, const char* func, const char* fmt, ...) DOCPIPE_PRINTF_FMT(5, 6);
    void warn(const char* file, int line, const char* func, const char* fmt, ...) DOCPIPE_PRINTF_FMT(5, 6);
    void error(const char* file, int line, const char* func, const char* fmt, ...) DOCPIPE_PRINTF_FMT(5, 6);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) docpipe::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  docpipe::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  docpipe::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) docpipe::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace docpipe

#endif // docpipe_CORE_LOGGER_HPP
