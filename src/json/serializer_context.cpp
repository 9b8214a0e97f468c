//! # Serializer Context Implementation
//!
//! ## Cache Population
//!
//! `resolve()` first probes the cache under a shared lock. On a miss the
//! lookup chain is computed while still holding the shared lock (it only
//! reads registrations), then the result is published under the exclusive
//! lock with `try_emplace`. When two threads race on the first resolution of
//! a type, both compute the same answer and the first insert wins; the loser
//! returns the winner's instance. A registration that lands between the two
//! locks bumps `generation_`, and the stale result is recomputed.

#include "json/serializer_context.hpp"

#include "log/log.hpp"

#include <deque>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

namespace jemit::json {

auto Resolution::adapt(const ObjectRef& value) const -> ObjectRef {
    const void* ptr = value.get();
    for (Upcast step : path) {
        ptr = step(ptr);
    }
    return ObjectRef(ptr, path.empty() ? value.type() : target);
}

SerializerContext::SerializerContext() : encoder_(make_rc<QuotedFieldNameEncoder>()) {}

SerializerContext::SerializerContext(Rc<const FieldNameEncoder> encoder)
    : encoder_(encoder ? std::move(encoder) : make_rc<QuotedFieldNameEncoder>()) {}

// ============================================================================
// Registration
// ============================================================================

void SerializerContext::add_type(std::type_index type, std::string name,
                                 std::vector<BaseEdge> bases) {
    std::unique_lock lock(mutex_);
    JEMIT_LOG_DEBUG("json", "declared type " << name << " with " << bases.size() << " base(s)");
    auto& info = types_[type];
    info.name = std::move(name);
    info.bases = std::move(bases);
    invalidate_locked();
}

void SerializerContext::add_serializer(std::type_index type, Rc<const Serializer> serializer) {
    std::unique_lock lock(mutex_);
    check_accepts_locked(type, serializer);
    JEMIT_LOG_DEBUG("json", "registered serializer for " << name_locked(type));
    explicit_[type] = std::move(serializer);
    invalidate_locked();
}

void SerializerContext::add_marker(std::type_index type, Rc<const Serializer> serializer,
                                   Inheritance inheritance) {
    std::unique_lock lock(mutex_);
    check_accepts_locked(type, serializer);
    JEMIT_LOG_DEBUG("json", "marked " << name_locked(type)
                                      << (inheritance == Inheritance::Subclasses
                                              ? " (inherited by subclasses)"
                                              : ""));
    markers_[type] = Marker{std::move(serializer), inheritance};
    invalidate_locked();
}

void SerializerContext::set_fallback(Rc<const Serializer> serializer) {
    std::unique_lock lock(mutex_);
    fallback_ = std::move(serializer);
    invalidate_locked();
}

void SerializerContext::set_field_name_encoder(Rc<const FieldNameEncoder> encoder) {
    std::unique_lock lock(mutex_);
    encoder_ = encoder ? std::move(encoder) : make_rc<QuotedFieldNameEncoder>();
}

void SerializerContext::check_accepts_locked(std::type_index type,
                                             const Rc<const Serializer>& serializer) const {
    if (!serializer) {
        throw std::invalid_argument("null serializer for " + name_locked(type));
    }
    auto handled = serializer->handled_type();
    if (handled && *handled != type) {
        throw std::invalid_argument("serializer for " + name_locked(*handled) +
                                    " cannot be registered for " + name_locked(type));
    }
}

void SerializerContext::invalidate_locked() {
    ++generation_;
    if (!cache_.empty()) {
        JEMIT_LOG_TRACE("json", "dropping " << cache_.size() << " cached resolution(s)");
        cache_.clear();
    }
}

// ============================================================================
// Lookup
// ============================================================================

auto SerializerContext::resolve(std::type_index type) const -> ResolveResult {
    while (true) {
        uint64_t generation;
        ResolveResult computed;
        {
            std::shared_lock lock(mutex_);
            auto it = cache_.find(type);
            if (it != cache_.end()) {
                hits_.fetch_add(1, std::memory_order_relaxed);
                return it->second;
            }
            misses_.fetch_add(1, std::memory_order_relaxed);
            generation = generation_;
            computed = compute_locked(type);
        }

        if (is_err(computed)) {
            return computed;
        }

        std::unique_lock lock(mutex_);
        if (generation != generation_) {
            continue;
        }
        auto [it, inserted] = cache_.try_emplace(type, unwrap(computed));
        if (inserted) {
            const auto& resolution = *it->second;
            JEMIT_LOG_TRACE("json", "resolved " << name_locked(type) << " via "
                                                << resolution_source_name(resolution.source)
                                                << " on " << name_locked(resolution.target));
        }
        return it->second;
    }
}

auto SerializerContext::compute_locked(std::type_index type) const -> ResolveResult {
    // 1. Explicit registration
    if (auto it = explicit_.find(type); it != explicit_.end()) {
        return make_rc<const Resolution>(
            Resolution{it->second, type, ResolutionSource::Explicit, {}});
    }

    // 2. Marker on the concrete type, inherited or not
    if (auto it = markers_.find(type); it != markers_.end()) {
        return make_rc<const Resolution>(
            Resolution{it->second.serializer, type, ResolutionSource::DirectMarker, {}});
    }

    // 3. Breadth-first over declared ancestors
    struct Step {
        std::type_index type;
        std::vector<Upcast> path;
    };

    std::deque<Step> worklist;
    std::unordered_set<std::type_index> visited;
    visited.insert(type);
    worklist.push_back(Step{type, {}});

    while (!worklist.empty()) {
        Step current = std::move(worklist.front());
        worklist.pop_front();

        auto info = types_.find(current.type);
        if (info == types_.end()) {
            continue;
        }

        for (const auto& base : info->second.bases) {
            if (!visited.insert(base.type).second) {
                continue;
            }

            std::vector<Upcast> path = current.path;
            path.push_back(base.upcast);

            auto marker = markers_.find(base.type);
            if (marker != markers_.end() && marker->second.inheritance == Inheritance::Subclasses) {
                return make_rc<const Resolution>(Resolution{marker->second.serializer, base.type,
                                                            ResolutionSource::InheritedMarker,
                                                            std::move(path)});
            }

            worklist.push_back(Step{base.type, std::move(path)});
        }
    }

    // 4. Fallback
    if (fallback_) {
        return make_rc<const Resolution>(
            Resolution{fallback_, type, ResolutionSource::Fallback, {}});
    }

    // 5. Nothing applies
    auto name = name_locked(type);
    return ResolveError{name, "no serializer registered for type " + name};
}

auto SerializerContext::has_own_serializer(std::type_index type) const -> bool {
    std::shared_lock lock(mutex_);
    return explicit_.count(type) > 0 || markers_.count(type) > 0;
}

auto SerializerContext::type_name(std::type_index type) const -> std::string {
    std::shared_lock lock(mutex_);
    return name_locked(type);
}

auto SerializerContext::name_locked(std::type_index type) const -> std::string {
    auto it = types_.find(type);
    if (it != types_.end()) {
        return it->second.name;
    }
    return type.name();
}

auto SerializerContext::field_name_encoder() const -> Rc<const FieldNameEncoder> {
    std::shared_lock lock(mutex_);
    return encoder_;
}

auto SerializerContext::get_stats() const -> Stats {
    std::shared_lock lock(mutex_);
    return {cache_.size(), hits_.load(std::memory_order_relaxed),
            misses_.load(std::memory_order_relaxed)};
}

} // namespace jemit::json
