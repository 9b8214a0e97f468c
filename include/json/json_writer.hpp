//! # JSON Writer
//!
//! A streaming, protocol-enforcing JSON writer. Callers (and serializers
//! invoked on their behalf) issue structural calls; the writer checks each call
//! against an explicit state machine and appends punctuation, separators and
//! indentation to an `OutputSink` as it goes.
//!
//! ## State Machine
//!
//! Every nesting level is a `Frame` on a stack. The root frame is in state
//! `Unknown` and accepts exactly one value. `Array` and `Object` frames are
//! pushed by `begin_array()`/`begin_object()` and popped by the matching end
//! call. `write_complex_property()` moves an `Object` frame to `ObjectAttr`,
//! which accepts exactly one value and then returns to `Object`.
//!
//! Any call the current state does not allow throws `ProtocolViolation`.
//! After any error the writer is poisoned and rejects every further call.
//!
//! ## Output Layout
//!
//! ```cpp
//! StringSink sink;
//! JsonWriter writer(ctx, sink);
//! writer.begin_object();
//! writer.write_property("a", 1);
//! writer.write_complex_property("tags");
//! writer.begin_array();
//! writer.write_value("x");
//! writer.end_array();
//! writer.end_object();
//! // {
//! //   "a": 1,
//! //   "tags": [
//! //     "x"
//! //   ]
//! // }
//! ```
//!
//! ## Values
//!
//! `write_value()` accepts null, booleans, numbers, strings, optionals,
//! pointers (null pointers emit `null`), ranges (arrays), string-keyed maps
//! (objects) and any other type through the `SerializerContext`. A string,
//! optional, pointer, map or range type that has its own registration in the
//! context (explicit or a marker) is written by that serializer instead.
//!
//! ## Thread Safety
//!
//! A writer is a single-threaded session. The `SerializerContext` it uses may
//! be shared with writers on other threads.

#pragma once

#include "common.hpp"
#include "json/field_name_encoder.hpp"
#include "json/indent_cache.hpp"
#include "json/json_error.hpp"
#include "json/json_text.hpp"
#include "json/output_sink.hpp"
#include "json/serializer.hpp"
#include "json/serializer_context.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <vector>

namespace jemit::json {

/// Formatting options for a writer session.
struct WriterOptions {
    /// Spaces per nesting level in pretty mode.
    int indent_factor = DEFAULT_INDENT_FACTOR;

    /// Emit no whitespace at all.
    bool compact = false;
};

namespace detail {

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_smart_pointer : std::false_type {};
template <typename T, typename D> struct is_smart_pointer<std::unique_ptr<T, D>> : std::true_type {};
template <typename T> struct is_smart_pointer<std::shared_ptr<T>> : std::true_type {};

template <typename T>
concept CharPointer = std::is_pointer_v<T> && std::is_same_v<std::remove_cv_t<std::remove_pointer_t<T>>, char>;

template <typename T>
concept StringLike = !CharPointer<T> && std::is_convertible_v<const T&, std::string_view>;

template <typename T>
concept MapLike = std::ranges::range<T> && requires {
    typename T::key_type;
    typename T::mapped_type;
} && std::is_convertible_v<const typename T::key_type&, std::string_view>;

template <typename T>
concept ArrayLike = std::ranges::range<T> && !StringLike<T> && !MapLike<T>;

/// Types the writer can render without a serializer.
template <typename T>
concept NativeComposite = StringLike<T> || is_optional<T>::value || std::is_pointer_v<T> ||
                          is_smart_pointer<T>::value || MapLike<T> || ArrayLike<T>;

} // namespace detail

class JsonWriter {
public:
    /// Nesting state of a frame.
    enum class State {
        Unknown,    ///< Root: nothing or one complete value written
        Array,      ///< Inside an array
        Object,     ///< Inside an object, between properties
        ObjectAttr, ///< Inside an object, property name written, value pending
    };

    /// Progress of a value written on behalf of a frame by a serializer.
    enum class Delegation {
        None,     ///< No serializer running for this frame
        Pending,  ///< Separator written, serializer has not emitted yet
        Consumed, ///< Serializer emitted its one value
    };

    /// Starts a session writing to `out`.
    ///
    /// # Panics
    ///
    /// Throws `std::invalid_argument` if `context` is null.
    JsonWriter(Rc<const SerializerContext> context, OutputSink& out, WriterOptions options = {});

    JsonWriter(const JsonWriter&) = delete;
    JsonWriter& operator=(const JsonWriter&) = delete;

    // ========================================================================
    // Structure
    // ========================================================================

    void begin_array();
    void end_array();
    void begin_object();
    void end_object();

    /// Writes a property name; the next call must produce its value.
    void write_complex_property(std::string_view name);

    // ========================================================================
    // Values
    // ========================================================================

    void write_value(std::nullptr_t) {
        write_token("null");
    }

    void write_value(const char* value) {
        if (value == nullptr) {
            write_token("null");
        } else {
            write_token(quote_string(value));
        }
    }

    template <typename T> void write_value(const T& value) {
        using U = std::remove_cvref_t<T>;

        if constexpr (std::is_same_v<U, bool>) {
            write_token(value ? "true" : "false");
        } else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>) {
            write_token(format_integer(static_cast<int64_t>(value)));
        } else if constexpr (std::is_integral_v<U>) {
            write_token(format_unsigned(static_cast<uint64_t>(value)));
        } else if constexpr (std::is_floating_point_v<U>) {
            write_token(format_double(static_cast<double>(value)));
        } else if constexpr (detail::CharPointer<U>) {
            write_value(static_cast<const char*>(value));
        } else if constexpr (detail::NativeComposite<U>) {
            if (context_->has_own_serializer(std::type_index(typeid(U)))) {
                write_object(ObjectRef::of(value));
            } else {
                write_native(value);
            }
        } else {
            write_object(ObjectRef::of(value));
        }
    }

    /// Writes a value through the serializer resolved for its runtime type.
    ///
    /// # Panics
    ///
    /// Throws `UnresolvedTypeError` if the context has no serializer for
    /// `value.type()`.
    void write_object(const ObjectRef& value);

    /// Writes `name` and `value` as one property of the current object.
    template <typename T> void write_property(std::string_view name, const T& value) {
        write_complex_property(name);
        write_value(value);
    }

    void write_property(std::string_view name, const char* value) {
        write_complex_property(name);
        write_value(value);
    }

    /// Writes an already-serialized JSON token as a value. The caller vouches
    /// that `token` is valid JSON.
    void write_raw_value(std::string_view token) {
        write_token(token);
    }

    // ========================================================================
    // Session
    // ========================================================================

    /// `true` once exactly one top-level value has been written and closed.
    [[nodiscard]] auto is_complete() const -> bool;

    /// Checks that the document is complete and flushes the sink.
    ///
    /// # Panics
    ///
    /// Throws `ProtocolViolation` if the document is incomplete.
    void finish();

    /// Current nesting depth (0 at the root).
    [[nodiscard]] auto depth() const -> size_t {
        return frames_.back().depth;
    }

    /// State of the innermost frame.
    [[nodiscard]] auto state() const -> State {
        return frames_.back().state;
    }

    /// `true` after any error; the session must be discarded.
    [[nodiscard]] auto is_poisoned() const -> bool {
        return poisoned_;
    }

    [[nodiscard]] auto context() const -> const SerializerContext& {
        return *context_;
    }

    [[nodiscard]] auto options() const -> const WriterOptions& {
        return options_;
    }

private:
    struct Frame {
        State state;
        size_t depth;
        std::string_view indent;
        int items = 0;
        Delegation delegation = Delegation::None;
    };

    /// What `enter_delegation()` set up, so `leave_delegation()` can verify it.
    struct DelegationToken {
        bool nested; ///< An enclosing serializer already owns the frame
        size_t frame;
    };

    /// Built-in rendering of strings, optionals, pointers, maps and ranges.
    template <typename U> void write_native(const U& value) {
        if constexpr (detail::StringLike<U>) {
            write_token(quote_string(std::string_view(value)));
        } else if constexpr (detail::is_optional<U>::value) {
            if (value.has_value()) {
                write_value(*value);
            } else {
                write_token("null");
            }
        } else if constexpr (std::is_pointer_v<U> || detail::is_smart_pointer<U>::value) {
            if (value) {
                write_value(*value);
            } else {
                write_token("null");
            }
        } else if constexpr (detail::MapLike<U>) {
            delegate(std::type_index(typeid(U)), [&] {
                begin_object();
                for (const auto& [key, item] : value) {
                    write_property(std::string_view(key), item);
                }
                end_object();
            });
        } else {
            delegate(std::type_index(typeid(U)), [&] {
                begin_array();
                for (const auto& item : value) {
                    write_value(item);
                }
                end_array();
            });
        }
    }

    template <typename Emit> void delegate(std::type_index type, Emit&& body) {
        ensure_usable();
        DelegationToken token = enter_delegation(type);
        try {
            body();
        } catch (const WriterError&) {
            poisoned_ = true;
            throw;
        } catch (const std::exception& e) {
            poisoned_ = true;
            throw StrategyInvocationError(context_->type_name(type),
                                          "serializer for " + context_->type_name(type) +
                                              " threw: " + e.what(),
                                          std::current_exception());
        } catch (...) {
            poisoned_ = true;
            throw;
        }
        leave_delegation(token, type);
    }

    auto enter_delegation(std::type_index type) -> DelegationToken;
    void leave_delegation(const DelegationToken& token, std::type_index type);

    void write_token(std::string_view token);
    void begin_container(State kind);
    void end_container(State kind);
    void push(State kind);

    void ensure_usable() const;
    [[noreturn]] void violation(const std::string& message);

    /// Runs the property name through the encoder, off the sink.
    [[nodiscard]] auto encode_name(std::string_view name) -> std::string;

    void emit(std::string_view text);
    void emit(char c);

    /// Poisons the session and rethrows the in-flight sink exception as a
    /// `SinkIOError`. Only valid inside a `catch` block.
    [[noreturn]] void sink_failed();
    void emit_line_break(std::string_view indent);
    void emit_separator(Frame& frame);

    Rc<const SerializerContext> context_;
    Rc<const FieldNameEncoder> encoder_;
    OutputSink* out_;
    WriterOptions options_;
    IndentCache indents_;
    std::vector<Frame> frames_;
    bool poisoned_ = false;
};

/// Returns a short upper-case name for a writer state.
const char* state_name(JsonWriter::State state);

/// Serializes a single value into a string.
///
/// The output is only returned once the whole value was written, so a failed
/// serialization never leaks a partial document.
template <typename T>
[[nodiscard]] auto to_json(Rc<const SerializerContext> context, const T& value,
                           WriterOptions options = {}) -> std::string {
    StringSink sink;
    JsonWriter writer(std::move(context), sink, options);
    writer.write_value(value);
    writer.finish();
    return sink.take();
}

} // namespace jemit::json
