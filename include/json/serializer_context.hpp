//! # Serializer Context
//!
//! The resolution context maps a value's runtime type to the serializer that
//! emits it. It is built once per serialization domain and shared read-mostly
//! by any number of `JsonWriter` sessions, possibly on different threads.
//!
//! ## Resolution Order
//!
//! For a concrete type `C`, the first match wins:
//!
//! 1. A serializer registered explicitly for `C`.
//! 2. A marker attached directly to `C` (inherited or not).
//! 3. Breadth-first over the declared ancestors of `C` (bases in declaration
//!    order, nearest first): the first ancestor with a marker flagged
//!    `Inheritance::Subclasses`.
//! 4. The fallback serializer, if one is set.
//! 5. Otherwise resolution fails.
//!
//! The outcome for each concrete type is cached; later lookups return the
//! very same `Resolution` instance.
//!
//! ## Declaring Types
//!
//! C++ has no runtime base-class reflection, so a type hierarchy that should
//! take part in step 3 must be declared:
//!
//! ```cpp
//! auto ctx = make_rc<SerializerContext>();
//! ctx->declare<Reference>("Reference");
//! ctx->declare<LongReference, Reference>("LongReference");
//! ctx->mark<Reference>(make_rc<ReferenceSerializer>(), Inheritance::Subclasses);
//!
//! auto result = ctx->resolve(typeid(LongReference));
//! // unwrap(result)->source == ResolutionSource::InheritedMarker
//! ```
//!
//! ## Thread Safety
//!
//! All members are safe to call concurrently. Registrations take an exclusive
//! lock and drop the cache; lookups take a shared lock.

#pragma once

#include "common.hpp"
#include "json/field_name_encoder.hpp"
#include "json/serializer.hpp"

#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace jemit::json {

/// Adjusts a pointer to a derived object into a pointer to one of its bases.
using Upcast = const void* (*)(const void*);

/// How a resolution was found.
enum class ResolutionSource {
    Explicit,        ///< Registered explicitly for the concrete type
    DirectMarker,    ///< Marker attached to the concrete type
    InheritedMarker, ///< Inherited marker on an ancestor
    Fallback,        ///< The context's fallback serializer
};

/// Returns a short name for a resolution source.
inline const char* resolution_source_name(ResolutionSource source) {
    switch (source) {
    case ResolutionSource::Explicit:
        return "explicit";
    case ResolutionSource::DirectMarker:
        return "marker";
    case ResolutionSource::InheritedMarker:
        return "inherited marker";
    case ResolutionSource::Fallback:
        return "fallback";
    }
    return "?";
}

/// The cached outcome of resolving one concrete type.
struct Resolution {
    /// The strategy to invoke.
    Rc<const Serializer> serializer;

    /// The type the strategy was registered for (the concrete type itself for
    /// explicit, direct and fallback resolutions).
    std::type_index target;

    ResolutionSource source;

    /// Upcasts from the concrete type to `target`, applied in order.
    std::vector<Upcast> path;

    /// Converts a reference to the concrete type into the reference the
    /// serializer expects.
    [[nodiscard]] auto adapt(const ObjectRef& value) const -> ObjectRef;
};

/// Reason a type could not be resolved.
struct ResolveError {
    std::string type_name;
    std::string message;
};

using ResolveResult = Result<Rc<const Resolution>, ResolveError>;

class SerializerContext {
public:
    /// Creates a context emitting standard quoted property names.
    SerializerContext();

    /// Creates a context with a custom property-name policy.
    explicit SerializerContext(Rc<const FieldNameEncoder> encoder);

    SerializerContext(const SerializerContext&) = delete;
    SerializerContext& operator=(const SerializerContext&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    /// Declares `T` with its direct bases, most significant first.
    ///
    /// `name` is used in logs and error messages (defaults to the
    /// implementation-defined `typeid` name). If `SerializerMarker<T>` is
    /// specialized, its serializer is registered as a marker on `T`.
    template <typename T, typename... Bases> void declare(std::string_view name = {}) {
        static_assert((std::is_base_of_v<Bases, T> && ...), "declared bases must be bases of T");

        std::vector<BaseEdge> bases;
        bases.reserve(sizeof...(Bases));
        (bases.push_back(BaseEdge{std::type_index(typeid(Bases)), &upcast<T, Bases>}), ...);

        add_type(std::type_index(typeid(T)), name.empty() ? typeid(T).name() : std::string(name),
                 std::move(bases));

        if constexpr (HasSerializerMarker<T>) {
            using Marked = typename SerializerMarker<T>::serializer;
            add_marker(std::type_index(typeid(T)), make_rc<Marked>(),
                       SerializerMarker<T>::inheritance);
        }
    }

    /// Registers `serializer` for values whose concrete type is exactly `T`.
    ///
    /// # Panics
    ///
    /// Throws `std::invalid_argument` if `serializer` is null or is typed for
    /// another type (see `Serializer::handled_type()`).
    template <typename T> void register_serializer(Rc<const Serializer> serializer) {
        add_serializer(std::type_index(typeid(T)), std::move(serializer));
    }

    /// Registers a callable `void(const T&, JsonWriter&)` for exactly `T`.
    template <typename T, typename F> void register_function(F&& fn) {
        register_serializer<T>(make_serializer<T>(std::forward<F>(fn)));
    }

    /// Attaches a marker naming `serializer` to `T`. Same checks as
    /// `register_serializer()`.
    template <typename T> void mark(Rc<const Serializer> serializer, Inheritance inheritance) {
        add_marker(std::type_index(typeid(T)), std::move(serializer), inheritance);
    }

    /// Sets the serializer used when nothing else matches (nullptr clears it).
    void set_fallback(Rc<const Serializer> serializer);

    /// Replaces the property-name policy used by writers created afterwards.
    void set_field_name_encoder(Rc<const FieldNameEncoder> encoder);

    // ========================================================================
    // Lookup
    // ========================================================================

    /// Resolves the serializer for a concrete runtime type.
    [[nodiscard]] auto resolve(std::type_index type) const -> ResolveResult;

    template <typename T> [[nodiscard]] auto resolve() const -> ResolveResult {
        return resolve(std::type_index(typeid(T)));
    }

    /// `true` if `type` itself has an explicit registration or a marker, that
    /// is, if its resolution would not come from an ancestor or the fallback.
    [[nodiscard]] auto has_own_serializer(std::type_index type) const -> bool;

    /// Returns the declared name of `type`, or its `typeid` name.
    [[nodiscard]] auto type_name(std::type_index type) const -> std::string;

    [[nodiscard]] auto field_name_encoder() const -> Rc<const FieldNameEncoder>;

    /// Cache statistics.
    struct Stats {
        size_t cached_types = 0;
        size_t hits = 0;
        size_t misses = 0;
    };

    [[nodiscard]] auto get_stats() const -> Stats;

private:
    struct BaseEdge {
        std::type_index type;
        Upcast upcast;
    };

    struct TypeInfo {
        std::string name;
        std::vector<BaseEdge> bases;
    };

    struct Marker {
        Rc<const Serializer> serializer;
        Inheritance inheritance;
    };

    template <typename Derived, typename Base> static auto upcast(const void* p) -> const void* {
        return static_cast<const Base*>(static_cast<const Derived*>(p));
    }

    void add_type(std::type_index type, std::string name, std::vector<BaseEdge> bases);
    void add_serializer(std::type_index type, Rc<const Serializer> serializer);
    void add_marker(std::type_index type, Rc<const Serializer> serializer,
                    Inheritance inheritance);

    /// Rejects a serializer that cannot read values of `type`. Caller holds
    /// the exclusive lock.
    void check_accepts_locked(std::type_index type, const Rc<const Serializer>& serializer) const;

    /// Drops cached resolutions. Caller holds the exclusive lock.
    void invalidate_locked();

    /// Runs the lookup chain. Caller holds at least a shared lock.
    [[nodiscard]] auto compute_locked(std::type_index type) const -> ResolveResult;

    [[nodiscard]] auto name_locked(std::type_index type) const -> std::string;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, TypeInfo> types_;
    std::unordered_map<std::type_index, Rc<const Serializer>> explicit_;
    std::unordered_map<std::type_index, Marker> markers_;
    Rc<const Serializer> fallback_;
    Rc<const FieldNameEncoder> encoder_;

    mutable std::unordered_map<std::type_index, Rc<const Resolution>> cache_;
    uint64_t generation_ = 0;
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
};

} // namespace jemit::json
