#include "folio/core/logger.hpp"
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <cstdio>
#include <ctime>

namespace folio {

// ============================================================================
// Global state
// ============================================================================

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    LogLevel global_level{LogLevel::Info};
    bool initialized{false};
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

String format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    char buffer[32];
    usize written = std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm_buf);

    StringBuilder sb;
    sb.append(std::string_view(buffer, written)).append('.');
    if (ms.count() < 100) sb.append('0');
    if (ms.count() < 10) sb.append('0');
    sb.append(static_cast<i64>(ms.count()));
    return sb.build();
}

// "[LEVEL] [logger] message", the part every sink shares
void append_body(StringBuilder& sb, const LogRecord& record) {
    sb.append('[').append(log_level_name(record.level)).append("] ");
    if (!record.logger_name.empty()) {
        sb.append('[').append(record.logger_name).append("] ");
    }
    sb.append(record.message);
}

void append_location(StringBuilder& sb, const LogRecord& record) {
    sb.append(" (").append(record.location.file).append(':')
      .append(static_cast<i64>(record.location.line)).append(')');
}

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default: return "";
    }
}

// Caller holds the state mutex
void init_locked(LoggingState& s) {
    if (s.initialized) return;
    if (s.sinks.empty()) {
        s.sinks.push_back(std::make_unique<ConsoleSink>());
    }
    s.initialized = true;
}

} // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c);
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    StringBuilder sb;
    if (m_use_colors) {
        sb.append(level_color(record.level));
    }
    append_body(sb, record);
    if (m_use_colors) {
        sb.append("\033[0m");
    }
    if (record.level <= LogLevel::Debug) {
        append_location(sb, record);
    }
    sb.append('\n');
    std::cerr << sb.view();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const char* filename) : m_file(std::fopen(filename, "a")) {}

FileSink::~FileSink() {
    if (m_file) {
        std::fclose(m_file);
    }
}

void FileSink::write(const LogRecord& record) {
    if (!m_file) return;

    StringBuilder sb;
    sb.append('[').append(format_timestamp(record.timestamp)).append("] ");
    append_body(sb, record);
    append_location(sb, record);
    sb.append('\n');
    std::fwrite(sb.view().data(), 1, sb.size(), m_file);
}

void FileSink::flush() {
    if (m_file) {
        std::fflush(m_file);
    }
}

void MemorySink::write(const LogRecord& record) {
    StringBuilder sb;
    append_body(sb, record);
    m_lines.push_back(sb.build());
}

bool MemorySink::contains(std::string_view fragment) const {
    for (const auto& line : m_lines) {
        if (line.view().find(fragment) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Logger implementation
// ============================================================================

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= m_level && level >= state().global_level;
}

void Logger::log(LogLevel level, std::string_view message, SourceLocation loc) {
    if (!is_enabled(level)) return;

    auto& s = state();
    std::lock_guard lock(s.mutex);
    init_locked(s);

    LogRecord record{
        .level = level,
        .message = message,
        .logger_name = m_name,
        .location = loc,
        .timestamp = std::chrono::system_clock::now()
    };

    for (auto& sink : s.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// Global logging functions
// ============================================================================

namespace logging {

void init() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    init_locked(s);
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    if (s.initialized) return;

    s.sinks = std::move(sinks);
    init_locked(s);
}

void shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    for (auto& sink : s.sinks) {
        sink->flush();
    }
    s.sinks.clear();
    s.loggers.clear();
    s.initialized = false;
}

void add_sink(std::unique_ptr<LogSink> sink) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    init_locked(s);
    s.sinks.push_back(std::move(sink));
}

void set_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.global_level = level;
}

Logger& get(std::string_view name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    std::string name_str(name);
    auto it = s.loggers.find(name_str);
    if (it != s.loggers.end()) {
        return *it->second;
    }

    auto logger = std::make_unique<Logger>(name);
    auto& ref = *logger;
    s.loggers.emplace(std::move(name_str), std::move(logger));
    return ref;
}

} // namespace logging

} // namespace folio
