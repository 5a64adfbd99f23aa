#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <chrono>
#include <vector>
#include <memory>
#include <format>
#include <cstdio>

namespace jade {

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

// ============================================================================
// Source location (GCC 9 compatible)
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
// Log record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view logger_name;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Log sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Writes to stderr; records are diagnostics, never document output
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends one line per record to a file, without colors or source location
// below Warn. A file that cannot be opened leaves the sink inert.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] bool is_open() const { return m_file != nullptr; }
    [[nodiscard]] const std::string& path() const { return m_path; }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::string m_path;
    std::FILE* m_file{nullptr};
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

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Debug)) {
            debug(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Info)) {
            info(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Warn)) {
            warn(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Error)) {
            error(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    [[nodiscard]] bool is_enabled(LogLevel level) const {
        return level >= m_level;
    }

private:
    void log_impl(LogLevel level, std::string_view message, SourceLocation loc);

    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Global logging configuration
// ============================================================================

namespace logging {

// Installs a console sink unless sinks were already installed
void init();

// Installs the given sinks instead of the console sink
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Flushes and drops all sinks. Loggers survive and reattach on next use.
void shutdown();

void add_sink(std::unique_ptr<LogSink> sink);

void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

// Get or create a named logger. References stay valid for the process lifetime.
[[nodiscard]] Logger& get(std::string_view name);

[[nodiscard]] Logger& default_logger();

void flush();

} // namespace logging

// ============================================================================
// Convenience macros
// ============================================================================

#define JADE_LOG_DEBUG(msg) ::jade::logging::default_logger().debug(msg)
#define JADE_LOG_INFO(msg)  ::jade::logging::default_logger().info(msg)
#define JADE_LOG_WARN(msg)  ::jade::logging::default_logger().warn(msg)
#define JADE_LOG_ERROR(msg) ::jade::logging::default_logger().error(msg)

#define JADE_LOG_DEBUG_FMT(fmt, ...) ::jade::logging::default_logger().debug_fmt(fmt, ##__VA_ARGS__)
#define JADE_LOG_INFO_FMT(fmt, ...)  ::jade::logging::default_logger().info_fmt(fmt, ##__VA_ARGS__)
#define JADE_LOG_WARN_FMT(fmt, ...)  ::jade::logging::default_logger().warn_fmt(fmt, ##__VA_ARGS__)
#define JADE_LOG_ERROR_FMT(fmt, ...) ::jade::logging::default_logger().error_fmt(fmt, ##__VA_ARGS__)

} // namespace jade
