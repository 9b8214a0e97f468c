//! # References
//!
//! A reference points at some business object by its primary key and carries
//! a human-readable title. All reference kinds serialize the same way:
//!
//! ```json
//! {
//!   "id": 42,
//!   "title": "Order #42"
//! }
//! ```
//!
//! `Reference` carries a `SerializerMarker` flagged `Inheritance::Subclasses`,
//! so once the hierarchy is declared with `register_reference_types()` every
//! subclass resolves to `ReferenceSerializer` without its own registration.

#pragma once

#include "json/json_writer.hpp"
#include "json/serializer.hpp"
#include "json/serializer_context.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace jemit::model {

/// Abstract reference to a business object.
class Reference {
public:
    virtual ~Reference() = default;

    /// Human-readable title.
    [[nodiscard]] virtual auto title() const -> const std::string& = 0;

    /// Writes the primary key as a single JSON value.
    virtual void write_id(json::JsonWriter& out) const = 0;

    /// Textual form of the primary key.
    [[nodiscard]] virtual auto id_string() const -> std::string = 0;

    /// `{id:<id>, title:<title>}`, for diagnostics.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// A reference whose primary key is an `Id`.
///
/// Two references are equal when they have the same concrete type and the
/// same id; the title does not take part.
template <typename Id> class BasicReference : public Reference {
public:
    BasicReference(Id id, std::string title) : id_(std::move(id)), title_(std::move(title)) {}

    [[nodiscard]] auto id() const -> const Id& {
        return id_;
    }

    [[nodiscard]] auto title() const -> const std::string& override {
        return title_;
    }

    void write_id(json::JsonWriter& out) const override {
        out.write_value(id_);
    }

    [[nodiscard]] auto id_string() const -> std::string override {
        if constexpr (std::is_arithmetic_v<Id>) {
            return std::to_string(id_);
        } else {
            return std::string(id_);
        }
    }

    friend auto operator==(const BasicReference& a, const BasicReference& b) -> bool {
        return typeid(a) == typeid(b) && a.id_ == b.id_;
    }

private:
    Id id_;
    std::string title_;
};

/// Reference keyed by a 64-bit integer.
class LongReference : public BasicReference<int64_t> {
public:
    /// Uses the decimal id as the title.
    explicit LongReference(int64_t id) : BasicReference(id, std::to_string(id)) {}

    LongReference(int64_t id, std::string title) : BasicReference(id, std::move(title)) {}
};

/// Reference keyed by a string code.
class StringReference : public BasicReference<std::string> {
public:
    explicit StringReference(std::string id) : BasicReference(id, id) {}

    StringReference(std::string id, std::string title)
        : BasicReference(std::move(id), std::move(title)) {}
};

/// Emits any `Reference` as `{"id": ..., "title": ...}`.
class ReferenceSerializer : public json::TypedSerializer<Reference> {
protected:
    void write(const Reference& value, json::JsonWriter& out) const override;
};

/// Declares the reference hierarchy on `ctx` (which also registers the
/// `Reference` marker).
void register_reference_types(json::SerializerContext& ctx);

} // namespace jemit::model

namespace jemit::json {

template <> struct SerializerMarker<model::Reference> {
    using serializer = model::ReferenceSerializer;
    static constexpr Inheritance inheritance = Inheritance::Subclasses;
};

} // namespace jemit::json
