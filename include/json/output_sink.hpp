//! # Output Sinks
//!
//! Destinations for the text produced by `JsonWriter`. The writer only ever
//! appends to a sink; it never seeks or rewinds.
//!
//! | Sink | Destination |
//! |------|-------------|
//! | `StringSink` | In-memory `std::string` buffer |
//! | `StreamSink` | Any `std::ostream` owned by the caller |
//! | `FileSink` | A file opened (and owned) by the sink |
//!
//! Sinks report failures by throwing `SinkIOError`.

#pragma once

#include "json/json_error.hpp"

#include <fstream>
#include <ostream>
#include <string>
#include <string_view>

namespace jemit::json {

/// Abstract base class for JSON output destinations.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    /// Appends `text` to the sink.
    virtual void write(std::string_view text) = 0;

    /// Appends a single character.
    virtual void write(char c) {
        write(std::string_view(&c, 1));
    }

    /// Flushes any buffered output.
    virtual void flush() = 0;
};

/// Sink that accumulates output in memory.
///
/// Useful when the output must only be published once the whole document
/// was written successfully.
class StringSink : public OutputSink {
public:
    StringSink() = default;

    void write(std::string_view text) override {
        buffer_.append(text);
    }
    void write(char c) override {
        buffer_.push_back(c);
    }
    void flush() override {}

    [[nodiscard]] auto str() const -> const std::string& {
        return buffer_;
    }

    /// Moves the accumulated text out, leaving the sink empty.
    [[nodiscard]] auto take() -> std::string;

    void clear() {
        buffer_.clear();
    }

private:
    std::string buffer_;
};

/// Sink writing to a caller-owned stream.
///
/// The stream state is checked after every write; a failed stream raises
/// `SinkIOError`.
class StreamSink : public OutputSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void write(std::string_view text) override;
    void write(char c) override;
    void flush() override;

private:
    void check(const char* operation);

    std::ostream& out_;
};

/// Sink writing to a file it owns.
class FileSink : public OutputSink {
public:
    /// Opens `path` for writing (truncating unless `append` is set).
    ///
    /// # Panics
    ///
    /// Throws `SinkIOError` if the file cannot be opened.
    explicit FileSink(const std::string& path, bool append = false);
    ~FileSink() override;

    void write(std::string_view text) override;
    void flush() override;

    [[nodiscard]] auto path() const -> const std::string& {
        return path_;
    }

private:
    std::string path_;
    std::ofstream file_;
};

} // namespace jemit::json
