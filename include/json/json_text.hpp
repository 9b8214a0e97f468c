//! # JSON Text Primitives
//!
//! Low-level helpers that render scalars as JSON tokens. They know nothing
//! about structure; `JsonWriter` decides where the tokens go.
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Backspace | `\b` |
//! | Form feed | `\f` |
//! | Line feed | `\n` |
//! | Carriage return | `\r` |
//! | Tab | `\t` |
//! | Control (0x00-0x1F) | `\uXXXX` |
//!
//! Bytes >= 0x80 are copied through unchanged (UTF-8 input is assumed).

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace jemit::json {

/// Appends `s` to `out` with JSON string escapes applied (no quotes).
void append_escaped(std::string& out, std::string_view s);

/// Returns `s` as a quoted JSON string literal.
[[nodiscard]] auto quote_string(std::string_view s) -> std::string;

/// Formats a signed integer.
[[nodiscard]] auto format_integer(int64_t value) -> std::string;

/// Formats an unsigned integer.
[[nodiscard]] auto format_unsigned(uint64_t value) -> std::string;

/// Formats a floating-point number.
///
/// Uses the shortest representation that round-trips. Integral values keep
/// a trailing `.0`; NaN and infinities (not representable in JSON) become
/// `null`.
[[nodiscard]] auto format_double(double value) -> std::string;

} // namespace jemit::json
