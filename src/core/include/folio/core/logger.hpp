#pragma once

#include "types.hpp"
#include "string.hpp"
#include <string_view>
#include <chrono>
#include <cstdio>
#include <vector>
#include <memory>
#include <optional>

namespace folio {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// Case-insensitive parse of a level name ("debug", "WARN", ...)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Source location
// ============================================================================

struct SourceLocation {
    const char* file{""};
    int line{0};

    static SourceLocation current(const char* file = __builtin_FILE(), int line = __builtin_LINE()) {
        return {file, line};
    }
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
// Log sink interface
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Coloured lines on stderr; Debug and below carry file:line
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends timestamped lines to a file
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
    std::FILE* m_file{nullptr};
};

// Keeps formatted "[LEVEL] [logger] message" lines in memory
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override {}

    [[nodiscard]] const std::vector<String>& lines() const { return m_lines; }
    [[nodiscard]] bool contains(std::string_view fragment) const;
    void clear() { m_lines.clear(); }

private:
    std::vector<String> m_lines;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name) : m_name(name) {}

    void log(LogLevel level, std::string_view msg, SourceLocation loc = SourceLocation::current());

    void trace(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Trace, msg, loc); }
    void debug(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Debug, msg, loc); }
    void info(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Info, msg, loc); }
    void warn(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Warn, msg, loc); }
    void error(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Error, msg, loc); }

    // Per-logger floor, applied on top of the global level
    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    [[nodiscard]] bool is_enabled(LogLevel level) const;

private:
    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Global logging configuration
// ============================================================================

namespace logging {

// Console sink on stderr unless sinks were already installed
void init();
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Flushes and drops every sink and logger
void shutdown();

void add_sink(std::unique_ptr<LogSink> sink);
void set_level(LogLevel level);

// Loggers live until shutdown(); references stay valid until then
[[nodiscard]] Logger& get(std::string_view name);

} // namespace logging

#ifdef NDEBUG
    #define FOLIO_DEBUG_LOG(logger, msg) ((void)0)
#else
    #define FOLIO_DEBUG_LOG(logger, msg) ::folio::logging::get(logger).debug(msg)
#endif

} // namespace folio
