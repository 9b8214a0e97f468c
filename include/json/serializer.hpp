//! # Serializer Strategies
//!
//! A serializer is the logic that emits one value of a known type through a
//! `JsonWriter`. Serializers are type-erased so that a single
//! `SerializerContext` can map any runtime type to its strategy.
//!
//! ## Writing a Serializer
//!
//! ```cpp
//! struct Point { int x; int y; };
//!
//! class PointSerializer : public TypedSerializer<Point> {
//! protected:
//!     void write(const Point& p, JsonWriter& out) const override {
//!         out.begin_object();
//!         out.write_property("x", p.x);
//!         out.write_property("y", p.y);
//!         out.end_object();
//!     }
//! };
//!
//! // Or, for one-off strategies:
//! auto s = make_serializer<Point>([](const Point& p, JsonWriter& out) {
//!     out.write_value(std::to_string(p.x) + "," + std::to_string(p.y));
//! });
//! ```
//!
//! A serializer must emit exactly one value (a scalar, an array or an
//! object) and close every container it opens.

#pragma once

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace jemit::json {

class JsonWriter;

/// A reference to a value together with its runtime type.
///
/// For polymorphic types `of()` captures the dynamic type and the address of
/// the most-derived object, which is what the resolution context keys on.
class ObjectRef {
public:
    ObjectRef(const void* ptr, std::type_index type) : ptr_(ptr), type_(type) {}

    template <typename T> [[nodiscard]] static auto of(const T& value) -> ObjectRef {
        if constexpr (std::is_polymorphic_v<T>) {
            return ObjectRef(dynamic_cast<const void*>(&value), std::type_index(typeid(value)));
        } else {
            return ObjectRef(&value, std::type_index(typeid(T)));
        }
    }

    [[nodiscard]] auto get() const -> const void* {
        return ptr_;
    }

    [[nodiscard]] auto type() const -> std::type_index {
        return type_;
    }

    /// Reinterprets the reference as `T`. Only valid when `type()` is `T`.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return *static_cast<const T*>(ptr_);
    }

private:
    const void* ptr_;
    std::type_index type_;
};

/// Type-erased serialization strategy.
///
/// `value.type()` is the type the serializer was registered for (the value
/// has already been adjusted to it), except for fallback serializers which
/// receive the value as its concrete runtime type.
class Serializer {
public:
    virtual ~Serializer() = default;

    virtual void serialize(const ObjectRef& value, JsonWriter& out) const = 0;

    /// The only type this serializer can read, or `std::nullopt` if it
    /// inspects `value.type()` itself and accepts anything.
    [[nodiscard]] virtual auto handled_type() const -> std::optional<std::type_index> {
        return std::nullopt;
    }
};

/// Base class for serializers of a single static type.
///
/// The context refuses to register one for any type but `T`. A value of
/// another type reaching `serialize()` (a typed fallback, say) is rejected
/// with `std::invalid_argument` instead of being reinterpreted.
template <typename T> class TypedSerializer : public Serializer {
public:
    void serialize(const ObjectRef& value, JsonWriter& out) const final {
        if (value.type() != std::type_index(typeid(T))) {
            throw std::invalid_argument(std::string("serializer for ") + typeid(T).name() +
                                        " cannot read a " + value.type().name());
        }
        write(value.as<T>(), out);
    }

    [[nodiscard]] auto handled_type() const -> std::optional<std::type_index> final {
        return std::type_index(typeid(T));
    }

protected:
    virtual void write(const T& value, JsonWriter& out) const = 0;
};

/// Serializer backed by a callable.
template <typename T> class FunctionSerializer : public TypedSerializer<T> {
public:
    using Function = std::function<void(const T&, JsonWriter&)>;

    explicit FunctionSerializer(Function fn) : fn_(std::move(fn)) {}

protected:
    void write(const T& value, JsonWriter& out) const override {
        fn_(value, out);
    }

private:
    Function fn_;
};

/// Wraps a callable `void(const T&, JsonWriter&)` into a shared serializer.
template <typename T, typename F>
[[nodiscard]] auto make_serializer(F&& fn) -> std::shared_ptr<const Serializer> {
    return std::make_shared<FunctionSerializer<T>>(
        typename FunctionSerializer<T>::Function(std::forward<F>(fn)));
}

// ============================================================================
// Type-Level Markers
// ============================================================================

/// Whether a marker applies only to the marked type or also to its subclasses.
enum class Inheritance {
    ThisType,   ///< Only values whose concrete type is the marked type
    Subclasses, ///< The marked type and every type declared to derive from it
};

/// Static marker trait. Specialize it to attach a serializer to a type:
///
/// ```cpp
/// template <> struct SerializerMarker<Shape> {
///     using serializer = ShapeSerializer;
///     static constexpr Inheritance inheritance = Inheritance::Subclasses;
/// };
/// ```
///
/// `SerializerContext::declare<T>()` picks the marker up. A specialization is
/// attached to exactly one type; derived classes do not see it, which keeps
/// the direct/inherited distinction intact.
template <typename T> struct SerializerMarker {};

template <typename T>
concept HasSerializerMarker = requires {
    typename SerializerMarker<T>::serializer;
    { SerializerMarker<T>::inheritance } -> std::convertible_to<Inheritance>;
};

} // namespace jemit::json
