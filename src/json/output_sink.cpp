//! # Output Sink Implementations
//!
//! Stream-backed sinks translate a failed `std::ostream` into `SinkIOError`
//! immediately, so the writer call that produced the failing write is the one
//! that reports it. A caller's stream with `exceptions()` enabled throws
//! `std::ios_base::failure` instead of only setting its state; that is
//! translated the same way.

#include "json/output_sink.hpp"

#include <cerrno>
#include <cstring>
#include <ios>
#include <string>

namespace jemit::json {

// ============================================================================
// StringSink
// ============================================================================

auto StringSink::take() -> std::string {
    std::string result = std::move(buffer_);
    buffer_.clear();
    return result;
}

// ============================================================================
// StreamSink
// ============================================================================

void StreamSink::check(const char* operation) {
    if (!out_) {
        throw SinkIOError(std::string("output stream failed during ") + operation);
    }
}

void StreamSink::write(std::string_view text) {
    try {
        out_.write(text.data(), static_cast<std::streamsize>(text.size()));
    } catch (const std::ios_base::failure& e) {
        throw SinkIOError(std::string("output stream failed during write: ") + e.what());
    }
    check("write");
}

void StreamSink::write(char c) {
    try {
        out_.put(c);
    } catch (const std::ios_base::failure& e) {
        throw SinkIOError(std::string("output stream failed during write: ") + e.what());
    }
    check("write");
}

void StreamSink::flush() {
    try {
        out_.flush();
    } catch (const std::ios_base::failure& e) {
        throw SinkIOError(std::string("output stream failed during flush: ") + e.what());
    }
    check("flush");
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : path_(path), file_(path, append ? (std::ios::out | std::ios::app)
                                      : (std::ios::out | std::ios::trunc)) {
    if (!file_.is_open()) {
        throw SinkIOError("cannot open '" + path + "': " + std::strerror(errno));
    }
}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(std::string_view text) {
    file_.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!file_) {
        throw SinkIOError("write to '" + path_ + "' failed");
    }
}

void FileSink::flush() {
    file_.flush();
    if (!file_) {
        throw SinkIOError("flush of '" + path_ + "' failed");
    }
}

} // namespace jemit::json
