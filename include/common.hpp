//! # Common Definitions
//!
//! This module provides the small set of shared types used throughout
//! jemit: version constants, the `Result` type used by fallible lookups,
//! and the smart pointer aliases.
//!
//! ## Error Handling Conventions
//!
//! - **Lookups return `Result<T, E>`**: resolution of serializers and option
//!   parsing report failure as a value the caller must inspect.
//! - **Session-fatal writer errors are exceptions**: a misused `JsonWriter`
//!   throws a `WriterError` subclass and the session is poisoned.

#ifndef JEMIT_COMMON_HPP
#define JEMIT_COMMON_HPP

#include <memory>
#include <string>
#include <variant>

namespace jemit {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string (e.g., "0.3.0").
constexpr const char* VERSION = "0.3.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 3;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = ctx.resolve(typeid(LongReference));
/// if (is_ok(result)) {
///     auto& resolution = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer. Serializers and contexts are shared this way.
template <typename T> using Rc = std::shared_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

/// Creates a new Rc containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace jemit

#endif // JEMIT_COMMON_HPP
