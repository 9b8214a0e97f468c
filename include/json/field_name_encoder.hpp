//! # Field-Name Encoders
//!
//! Policies for writing property names. `JsonWriter` calls the encoder of its
//! `SerializerContext` for every property it emits, so a relaxed dialect can be
//! produced without touching the writer.
//!
//! | Encoder | `name` | `my key` |
//! |---------|--------|----------|
//! | `QuotedFieldNameEncoder` | `"name"` | `"my key"` |
//! | `IdentifierFieldNameEncoder` | `name` | `"my key"` |

#pragma once

#include "json/output_sink.hpp"

#include <string_view>

namespace jemit::json {

class FieldNameEncoder {
public:
    virtual ~FieldNameEncoder() = default;

    /// Writes `name` as a property-name token to `out`.
    virtual void encode(std::string_view name, OutputSink& out) const = 0;
};

/// Standard JSON: every name is a quoted, escaped string literal.
class QuotedFieldNameEncoder : public FieldNameEncoder {
public:
    void encode(std::string_view name, OutputSink& out) const override;
};

/// Relaxed JavaScript-style keys: names that are valid identifiers
/// (`[A-Za-z_$][A-Za-z0-9_$]*`) are written bare, anything else is quoted.
class IdentifierFieldNameEncoder : public FieldNameEncoder {
public:
    void encode(std::string_view name, OutputSink& out) const override;

    /// Returns `true` if `name` may be written without quotes.
    [[nodiscard]] static auto is_identifier(std::string_view name) -> bool;
};

} // namespace jemit::json
