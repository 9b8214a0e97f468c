//! # Indentation Cache
//!
//! Memoized leading-whitespace strings for pretty-printed output.
//!
//! `indent_for(depth)` returns `depth * factor` spaces. Strings are built
//! lazily the first time a depth is requested and kept for the lifetime of the
//! cache. They are stored in a `std::deque`, so a returned view stays valid
//! while the cache grows.

#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>

namespace jemit::json {

/// Default number of spaces per nesting level.
constexpr int DEFAULT_INDENT_FACTOR = 2;

class IndentCache {
public:
    /// Creates a cache for `factor` spaces per level, prefilling `prealloc`
    /// levels. A negative factor is treated as zero.
    explicit IndentCache(int factor = DEFAULT_INDENT_FACTOR, size_t prealloc = 8);

    /// Returns the indentation string for `depth`.
    [[nodiscard]] auto indent_for(size_t depth) -> std::string_view;

    [[nodiscard]] auto factor() const -> size_t {
        return factor_;
    }

    /// Number of depths currently memoized.
    [[nodiscard]] auto cached_levels() const -> size_t {
        return strings_.size();
    }

private:
    size_t factor_;
    std::deque<std::string> strings_;
};

} // namespace jemit::json
