//! # Logger Implementation
//!
//! Implements the Logger singleton, ConsoleSink, FileSink, and LogFilter.
//! JSON-lines output is rendered by `json::JsonWriter` in compact mode.

#include "log/log.hpp"

#include "json/json_writer.hpp"

#include <cstdlib>
#include <iostream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#define JEMIT_ISATTY(fd) _isatty(fd)
#define JEMIT_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define JEMIT_ISATTY(fd) isatty(fd)
#define JEMIT_FILENO(f) fileno(f)
#endif

namespace jemit::log {

// ============================================================================
// Record Formatting
// ============================================================================

/// Detects if stderr supports ANSI color codes.
static bool detect_terminal_colors() {
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_ERROR_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE)
        return false;

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode))
        return false;

    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    if (SetConsoleMode(hOut, dwMode))
        return true;

    return JEMIT_ISATTY(JEMIT_FILENO(stderr)) != 0;
#else
    if (!JEMIT_ISATTY(JEMIT_FILENO(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
#endif
}

/// The context used for log lines. Records only hold scalars, so nothing is
/// ever resolved through it.
static Rc<const json::SerializerContext> log_context() {
    static const Rc<const json::SerializerContext> context =
        make_rc<json::SerializerContext>();
    return context;
}

std::string format_json_record(const LogRecord& record) {
    json::StringSink sink;
    json::JsonWriter writer(log_context(), sink, json::WriterOptions{0, true});
    writer.begin_object();
    writer.write_property("ts", record.timestamp_ms);
    writer.write_property("level", level_name(record.level));
    writer.write_property("module", record.module);
    writer.write_property("msg", record.message);
    writer.end_object();
    writer.finish();
    return sink.take();
}

static std::string format_text_record(const LogRecord& record, const char* color) {
    std::ostringstream oss;
    oss << get_timestamp() << " ";
    if (color) {
        oss << color;
    }

    // Pad level name to 5 chars for alignment
    oss << std::left << std::setw(5) << level_name(record.level);

    if (color) {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] " << record.message << "\n";
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

const char* ConsoleSink::level_color(LogLevel level) const {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m"; // Dark gray
    case LogLevel::Debug:
        return "\033[36m"; // Cyan
    case LogLevel::Info:
        return "\033[32m"; // Green
    case LogLevel::Warn:
        return "\033[33m"; // Yellow
    case LogLevel::Error:
        return "\033[31m"; // Red
    case LogLevel::Fatal:
        return "\033[1;31m"; // Bold red
    case LogLevel::Off:
        return "";
    }
    return "";
}

void ConsoleSink::write(const LogRecord& record) {
    if (format_ == LogFormat::JSON) {
        std::cerr << format_json_record(record) << "\n";
    } else {
        std::cerr << format_text_record(record,
                                        colors_enabled_ ? level_color(record.level) : nullptr);
    }
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    if (format_ == LogFormat::JSON) {
        file_ << format_json_record(record) << "\n";
    } else {
        file_ << format_text_record(record, nullptr);
    }

    // Auto-flush on Error and Fatal
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = token.substr(eq + 1);
            if (mod == "*") {
                default_level_ = parse_level(lvl);
            } else {
                module_levels_[std::string(mod)] = parse_level(lvl);
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // Without a "*=level" entry the configured level is the default
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        // The fast path must not reject what a module override accepts
        logger.level_ = logger.filter_.min_level();
    } else {
        logger.filter_ = LogFilter();
        logger.filter_.set_default_level(config.level);
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    // Fast path: level check without lock
    if (level < level_)
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();

    log(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    if (filter_.min_level() < level_) {
        level_ = filter_.min_level();
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace jemit::log
