//! # JSON Writer Implementation
//!
//! ## Transition Summary
//!
//! | State | begin_* | write value | write_complex_property | end_* |
//! |-------|---------|-------------|------------------------|-------|
//! | `Unknown` | once: `[` / `{` | once | - | - |
//! | `Array` | `,`? then ` [` / ` {` | `,`? newline indent value | - | matching only |
//! | `Object` | - | - | `,`? newline indent name `: ` | matching only |
//! | `ObjectAttr` | `[` / `{`, back to `Object` | value, back to `Object` | - | - |
//!
//! ## Delegated Writes
//!
//! When a complex value is written, the separator is emitted up front and the
//! frame is marked `Pending` before the serializer runs. The serializer's
//! first value-producing call then skips the separator logic and marks the
//! frame `Consumed`. Anything else on that frame while the serializer runs is
//! a protocol violation. After the serializer returns, the frame must be back
//! on top of the stack and `Consumed`.
//!
//! Closing brackets are always preceded by a newline and the parent's
//! indentation, so an empty array prints as `[` newline `]`.

#include "json/json_writer.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace jemit::json {

const char* state_name(JsonWriter::State state) {
    switch (state) {
    case JsonWriter::State::Unknown:
        return "UNKNOWN";
    case JsonWriter::State::Array:
        return "ARRAY";
    case JsonWriter::State::Object:
        return "OBJECT";
    case JsonWriter::State::ObjectAttr:
        return "OBJATTR";
    }
    return "?";
}

JsonWriter::JsonWriter(Rc<const SerializerContext> context, OutputSink& out, WriterOptions options)
    : context_(std::move(context)), out_(&out), options_(options),
      indents_(options.indent_factor) {
    if (!context_) {
        throw std::invalid_argument("JsonWriter requires a serializer context");
    }
    encoder_ = context_->field_name_encoder();
    frames_.reserve(16);
    frames_.push_back(Frame{State::Unknown, 0, indents_.indent_for(0)});
}

// ============================================================================
// Structure
// ============================================================================

void JsonWriter::begin_array() {
    begin_container(State::Array);
}

void JsonWriter::end_array() {
    end_container(State::Array);
}

void JsonWriter::begin_object() {
    begin_container(State::Object);
}

void JsonWriter::end_object() {
    end_container(State::Object);
}

void JsonWriter::begin_container(State kind) {
    ensure_usable();
    const char* op = kind == State::Array ? "begin_array()" : "begin_object()";
    const char open = kind == State::Array ? '[' : '{';
    Frame& frame = frames_.back();

    if (frame.delegation == Delegation::Consumed) {
        violation(std::string(op) + ": serializer already wrote its value");
    }

    if (frame.delegation == Delegation::Pending) {
        // Separator was written before the serializer started
        frame.delegation = Delegation::Consumed;
        if (frame.state == State::Array && !options_.compact) {
            emit(' ');
        } else if (frame.state == State::ObjectAttr) {
            frame.state = State::Object;
        }
        emit(open);
        push(kind);
        return;
    }

    switch (frame.state) {
    case State::Unknown:
        if (frame.items > 0) {
            violation(std::string(op) + ": a top-level value was already written");
        }
        frame.items = 1;
        emit(open);
        break;
    case State::Array:
        if (frame.items++ > 0) {
            emit(',');
        }
        if (!options_.compact) {
            emit(' ');
        }
        emit(open);
        break;
    case State::ObjectAttr:
        frame.state = State::Object;
        emit(open);
        break;
    case State::Object:
        violation(std::string(op) + " in state OBJECT without a property name");
    }
    push(kind);
}

void JsonWriter::end_container(State kind) {
    ensure_usable();
    const char* op = kind == State::Array ? "end_array()" : "end_object()";
    const Frame& frame = frames_.back();

    if (frame.state != kind) {
        violation(std::string(op) + " in state " + state_name(frame.state));
    }
    if (frame.delegation != Delegation::None) {
        violation(std::string(op) + " while a serializer is writing into this container");
    }

    const Frame& parent = frames_[frames_.size() - 2];
    emit_line_break(parent.indent);
    emit(kind == State::Array ? ']' : '}');
    frames_.pop_back();
}

void JsonWriter::push(State kind) {
    const size_t depth = frames_.back().depth + 1;
    frames_.push_back(Frame{kind, depth, indents_.indent_for(depth)});
}

void JsonWriter::write_complex_property(std::string_view name) {
    ensure_usable();
    Frame& frame = frames_.back();

    if (frame.state != State::Object) {
        violation(std::string("property '") + std::string(name) + "' written in state " +
                  state_name(frame.state));
    }
    if (frame.delegation != Delegation::None) {
        violation(std::string("property '") + std::string(name) +
                  "' written while a serializer is writing a property value");
    }

    const std::string encoded = encode_name(name);
    emit_separator(frame);
    emit(encoded);
    emit(options_.compact ? ":" : ": ");
    frame.state = State::ObjectAttr;
}

auto JsonWriter::encode_name(std::string_view name) -> std::string {
    StringSink encoded;
    try {
        encoder_->encode(name, encoded);
    } catch (const WriterError&) {
        poisoned_ = true;
        throw;
    } catch (const std::exception& e) {
        poisoned_ = true;
        throw StrategyInvocationError("field name encoder",
                                      "field name encoder failed on '" + std::string(name) +
                                          "': " + e.what(),
                                      std::current_exception());
    } catch (...) {
        poisoned_ = true;
        throw;
    }
    return encoded.take();
}

// ============================================================================
// Values
// ============================================================================

void JsonWriter::write_token(std::string_view token) {
    ensure_usable();
    Frame& frame = frames_.back();

    if (frame.delegation == Delegation::Consumed) {
        violation("value written after the serializer already wrote its value");
    }

    if (frame.delegation == Delegation::Pending) {
        frame.delegation = Delegation::Consumed;
        if (frame.state == State::ObjectAttr) {
            frame.state = State::Object;
        }
        emit(token);
        return;
    }

    switch (frame.state) {
    case State::Unknown:
        if (frame.items > 0) {
            violation("a top-level value was already written");
        }
        frame.items = 1;
        break;
    case State::Array:
        emit_separator(frame);
        break;
    case State::ObjectAttr:
        frame.state = State::Object;
        break;
    case State::Object:
        violation("value written in state OBJECT without a property name");
    }
    emit(token);
}

void JsonWriter::write_object(const ObjectRef& value) {
    delegate(value.type(), [&] {
        auto result = context_->resolve(value.type());
        if (is_err(result)) {
            const auto& error = unwrap_err(result);
            throw UnresolvedTypeError(error.type_name, error.message);
        }
        Rc<const Resolution> resolution = unwrap(result);
        resolution->serializer->serialize(resolution->adapt(value), *this);
    });
}

auto JsonWriter::enter_delegation(std::type_index type) -> DelegationToken {
    const size_t index = frames_.size() - 1;
    Frame& frame = frames_.back();

    switch (frame.delegation) {
    case Delegation::Pending:
        // A serializer handing its value on to another serializer
        return DelegationToken{true, index};
    case Delegation::Consumed:
        violation("serializer wrote a second value (" + context_->type_name(type) + ")");
    case Delegation::None:
        break;
    }

    switch (frame.state) {
    case State::Unknown:
        if (frame.items > 0) {
            violation("a top-level value was already written");
        }
        frame.items = 1;
        break;
    case State::Array:
        emit_separator(frame);
        break;
    case State::ObjectAttr:
        break;
    case State::Object:
        violation("value written in state OBJECT without a property name");
    }
    frame.delegation = Delegation::Pending;
    return DelegationToken{false, index};
}

void JsonWriter::leave_delegation(const DelegationToken& token, std::type_index type) {
    if (token.nested) {
        return;
    }

    if (frames_.size() - 1 != token.frame) {
        poisoned_ = true;
        const size_t open = frames_.size() - 1 - token.frame;
        throw StrategyInvocationError(context_->type_name(type),
                                      "serializer for " + context_->type_name(type) + " left " +
                                          std::to_string(open) + " container(s) open");
    }

    Frame& frame = frames_.back();
    if (frame.delegation != Delegation::Consumed) {
        poisoned_ = true;
        throw StrategyInvocationError(context_->type_name(type), "serializer for " +
                                                                     context_->type_name(type) +
                                                                     " did not write a value");
    }
    frame.delegation = Delegation::None;
}

// ============================================================================
// Session
// ============================================================================

auto JsonWriter::is_complete() const -> bool {
    const Frame& root = frames_.front();
    return !poisoned_ && frames_.size() == 1 && root.items > 0 &&
           root.delegation == Delegation::None;
}

void JsonWriter::finish() {
    ensure_usable();
    if (!is_complete()) {
        if (frames_.size() > 1) {
            violation("document is incomplete: " + std::to_string(frames_.size() - 1) +
                      " container(s) still open");
        }
        violation("document is incomplete: no value was written");
    }
    try {
        out_->flush();
    } catch (...) {
        sink_failed();
    }
}

void JsonWriter::ensure_usable() const {
    if (poisoned_) {
        throw ProtocolViolation("writer session was poisoned by an earlier error");
    }
}

void JsonWriter::violation(const std::string& message) {
    poisoned_ = true;
    throw ProtocolViolation(message);
}

// ============================================================================
// Output
// ============================================================================

void JsonWriter::emit(std::string_view text) {
    try {
        out_->write(text);
    } catch (...) {
        sink_failed();
    }
}

void JsonWriter::emit(char c) {
    try {
        out_->write(c);
    } catch (...) {
        sink_failed();
    }
}

void JsonWriter::sink_failed() {
    poisoned_ = true;
    try {
        throw;
    } catch (const WriterError&) {
        throw;
    } catch (const std::exception& e) {
        throw SinkIOError(std::string("output sink failed: ") + e.what());
    }
}

void JsonWriter::emit_line_break(std::string_view indent) {
    if (options_.compact) {
        return;
    }
    emit('\n');
    emit(indent);
}

void JsonWriter::emit_separator(Frame& frame) {
    if (frame.items++ > 0) {
        emit(',');
    }
    emit_line_break(frame.indent);
}

} // namespace jemit::json
