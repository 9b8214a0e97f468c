//! # jemit Logging
//!
//! A small structured logging library with:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file and null sinks
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via JEMIT_MIN_LOG_LEVEL
//! - Text or JSON-lines output (JSON lines are produced by `json::JsonWriter`)
//!
//! ## Usage
//!
//! ```cpp
//! JEMIT_LOG_INFO("cli", "Writing " << count << " references to " << path);
//! JEMIT_LOG_DEBUG("json", "resolved " << name << " via inherited marker");
//! ```

#ifndef JEMIT_LOG_HPP
#define JEMIT_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jemit::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "TRACE", "DEBUG").
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a log level from a lower- or upper-case name.
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "json", "cli")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One compact JSON object per line
};

/// Renders a record as a single compact JSON object (no trailing newline):
/// `{"ts":...,"level":"INFO","module":"cli","msg":"..."}`.
std::string format_json_record(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// File sink. Auto-flushes on Error and Fatal messages.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Sink that discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "json=trace,cli=info,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Format: "module1=level,module2=level,*=default_level".
    /// A bare module name enables everything from that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Minimum configured level across all modules and the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Logs at Warn and above to the console until `Logger::init()` is called.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before formatting the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (messages are dropped until one is added).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parses logging options from argv: --log-level, --log-filter, --log-file,
/// --log-format, -v/-vv/-vvv, -q. Falls back to the JEMIT_LOG environment
/// variable when neither a level nor a filter was given.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns `true` if `arg` is one of the options `parse_log_options` consumes.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef JEMIT_MIN_LOG_LEVEL
#define JEMIT_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define JEMIT_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= JEMIT_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::jemit::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define JEMIT_LOG_TRACE(module, msg) JEMIT_LOG_IMPL(::jemit::log::LogLevel::Trace, module, msg)
#define JEMIT_LOG_DEBUG(module, msg) JEMIT_LOG_IMPL(::jemit::log::LogLevel::Debug, module, msg)
#define JEMIT_LOG_INFO(module, msg) JEMIT_LOG_IMPL(::jemit::log::LogLevel::Info, module, msg)
#define JEMIT_LOG_WARN(module, msg) JEMIT_LOG_IMPL(::jemit::log::LogLevel::Warn, module, msg)
#define JEMIT_LOG_ERROR(module, msg) JEMIT_LOG_IMPL(::jemit::log::LogLevel::Error, module, msg)
#define JEMIT_LOG_FATAL(module, msg) JEMIT_LOG_IMPL(::jemit::log::LogLevel::Fatal, module, msg)

} // namespace jemit::log

#endif // JEMIT_LOG_HPP
