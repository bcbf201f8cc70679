#pragma once

#include "types.hpp"
#include "string.hpp"
#include <chrono>
#include <cstdlib>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scrape {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : u8 {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// Accepts the lower- or upper-case level names ("warn", "WARN", "warning").
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Source location
// ============================================================================

struct SourceLocation {
    const char* file;
    int line;
    const char* function;

    static SourceLocation current(const char* file = __builtin_FILE(),
                                  int line = __builtin_LINE(),
                                  const char* func = __builtin_FUNCTION()) {
        return {file, line, func};
    }

    [[nodiscard]] const char* file_name() const { return file; }
    [[nodiscard]] int line_number() const { return line; }
    [[nodiscard]] const char* function_name() const { return function; }
};

// ============================================================================
// Log record and sinks
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view logger_name;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
};

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Writes every record to stderr so stdout stays reserved for results.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

class FileSink : public LogSink {
public:
    explicit FileSink(const char* filename);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] bool is_open() const { return m_file != nullptr; }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    void* m_file{nullptr};
};

// Keeps formatted records in memory; used by tests to observe logging.
class MemorySink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string logger_name;
        std::string message;
    };

    void write(const LogRecord& record) override;
    void flush() override {}

    [[nodiscard]] std::vector<Entry> entries() const;
    [[nodiscard]] bool contains(std::string_view needle) const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<Entry> m_entries;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name);

    void trace(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void debug(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void info(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void warn(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void error(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void fatal(std::string_view msg, SourceLocation loc = SourceLocation::current());

    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Trace)) {
            trace(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Debug)) {
            debug(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Info)) {
            info(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Warn)) {
            warn(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Error)) {
            error(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void fatal_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Fatal)) {
            fatal(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    // Checks both the logger's own level and the global level
    [[nodiscard]] bool is_enabled(LogLevel level) const;

private:
    void log_impl(LogLevel level, std::string_view message, SourceLocation loc);

    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Global logging configuration
// ============================================================================

namespace logging {

// Installs a console sink; no-op when already initialized
void init();
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Reads SCRAPE_LOG (trace|debug|info|warn|error|off) and applies it as the
// global level. Unknown values leave the level unchanged.
void init_from_env();

void shutdown();
void add_sink(std::unique_ptr<LogSink> sink);

void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

[[nodiscard]] Logger& get(std::string_view name);
[[nodiscard]] Logger& default_logger();

void flush();

} // namespace logging

// ============================================================================
// Convenience macros
// ============================================================================

#define SCRAPE_LOG_TRACE(msg) ::scrape::logging::default_logger().trace(msg)
#define SCRAPE_LOG_DEBUG(msg) ::scrape::logging::default_logger().debug(msg)
#define SCRAPE_LOG_INFO(msg)  ::scrape::logging::default_logger().info(msg)
#define SCRAPE_LOG_WARN(msg)  ::scrape::logging::default_logger().warn(msg)
#define SCRAPE_LOG_ERROR(msg) ::scrape::logging::default_logger().error(msg)
#define SCRAPE_LOG_FATAL(msg) ::scrape::logging::default_logger().fatal(msg)

#define SCRAPE_LOG_TRACE_FMT(fmt, ...) ::scrape::logging::default_logger().trace_fmt(fmt, ##__VA_ARGS__)
#define SCRAPE_LOG_DEBUG_FMT(fmt, ...) ::scrape::logging::default_logger().debug_fmt(fmt, ##__VA_ARGS__)
#define SCRAPE_LOG_INFO_FMT(fmt, ...)  ::scrape::logging::default_logger().info_fmt(fmt, ##__VA_ARGS__)
#define SCRAPE_LOG_WARN_FMT(fmt, ...)  ::scrape::logging::default_logger().warn_fmt(fmt, ##__VA_ARGS__)
#define SCRAPE_LOG_ERROR_FMT(fmt, ...) ::scrape::logging::default_logger().error_fmt(fmt, ##__VA_ARGS__)

#ifdef NDEBUG
    #define SCRAPE_DEBUG_ASSERT(condition, msg) ((void)0)
#else
    #define SCRAPE_DEBUG_ASSERT(condition, msg) SCRAPE_ASSERT(condition, msg)
#endif

#define SCRAPE_ASSERT(condition, msg) \
    do { \
        if (!(condition)) { \
            SCRAPE_LOG_FATAL("Assertion failed: " #condition " - " msg); \
            ::scrape::logging::flush(); \
            std::abort(); \
        } \
    } while (false)

#define SCRAPE_UNREACHABLE() \
    do { \
        SCRAPE_LOG_FATAL("Unreachable code reached"); \
        ::scrape::logging::flush(); \
        std::abort(); \
    } while (false)

} // namespace scrape
