//! # JSON Writer Error Types
//!
//! This module provides the error types raised by `JsonWriter`, the output
//! sinks and the serializer resolution machinery.
//!
//! ## Error Kinds
//!
//! | Kind | Raised when |
//! |------|-------------|
//! | `ProtocolViolation` | A structural call is illegal in the current state |
//! | `UnresolvedType` | No serializer applies to a value's runtime type |
//! | `StrategyInvocation` | A serializer failed while emitting its value |
//! | `SinkIO` | The output sink could not accept more output |
//!
//! Every kind is fatal to the writer session that raised it: the session is
//! poisoned and its output must be discarded.
//!
//! ## Example
//!
//! ```cpp
//! try {
//!     writer.end_array();
//! } catch (const ProtocolViolation& e) {
//!     std::cerr << e.what() << std::endl;
//!     // Output: "protocol violation: end_array() in state UNKNOWN"
//! }
//! ```

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace jemit::json {

/// Discriminates the concrete writer error without RTTI on the caller side.
enum class ErrorKind {
    ProtocolViolation,
    UnresolvedType,
    StrategyInvocation,
    SinkIO,
};

/// Returns a stable lowercase name for an error kind.
inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ProtocolViolation:
        return "protocol violation";
    case ErrorKind::UnresolvedType:
        return "unresolved type";
    case ErrorKind::StrategyInvocation:
        return "serializer failed";
    case ErrorKind::SinkIO:
        return "sink i/o error";
    }
    return "writer error";
}

/// Base class of every error raised while emitting JSON.
///
/// `what()` is formatted as `"<kind>: <message>"`; `message()` returns the
/// message alone.
class WriterError : public std::runtime_error {
public:
    WriterError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message), kind_(kind),
          message_(message) {}

    [[nodiscard]] auto kind() const noexcept -> ErrorKind {
        return kind_;
    }

    [[nodiscard]] auto message() const -> const std::string& {
        return message_;
    }

private:
    ErrorKind kind_;
    std::string message_;
};

/// A structural method was invoked in a state that forbids it.
class ProtocolViolation : public WriterError {
public:
    explicit ProtocolViolation(const std::string& message)
        : WriterError(ErrorKind::ProtocolViolation, message) {}
};

/// The serializer context found no applicable strategy for a runtime type.
class UnresolvedTypeError : public WriterError {
public:
    UnresolvedTypeError(std::string type_name, const std::string& message)
        : WriterError(ErrorKind::UnresolvedType, message), type_name_(std::move(type_name)) {}

    /// Name of the runtime type that could not be resolved.
    [[nodiscard]] auto type_name() const -> const std::string& {
        return type_name_;
    }

private:
    std::string type_name_;
};

/// The chosen serializer failed while emitting a value.
///
/// When the failure was an exception thrown by the serializer itself, the
/// original exception is kept in `cause()` and can be rethrown with
/// `std::rethrow_exception`.
class StrategyInvocationError : public WriterError {
public:
    StrategyInvocationError(std::string type_name, const std::string& message,
                            std::exception_ptr cause = nullptr)
        : WriterError(ErrorKind::StrategyInvocation, message), type_name_(std::move(type_name)),
          cause_(std::move(cause)) {}

    [[nodiscard]] auto type_name() const -> const std::string& {
        return type_name_;
    }

    [[nodiscard]] auto cause() const -> std::exception_ptr {
        return cause_;
    }

private:
    std::string type_name_;
    std::exception_ptr cause_;
};

/// The underlying output sink raised an error.
class SinkIOError : public WriterError {
public:
    explicit SinkIOError(const std::string& message) : WriterError(ErrorKind::SinkIO, message) {}
};

} // namespace jemit::json
