#include "json/indent_cache.hpp"

namespace jemit::json {

IndentCache::IndentCache(int factor, size_t prealloc)
    : factor_(factor > 0 ? static_cast<size_t>(factor) : 0) {
    for (size_t level = 0; level < prealloc; ++level) {
        strings_.emplace_back(level * factor_, ' ');
    }
}

auto IndentCache::indent_for(size_t depth) -> std::string_view {
    while (strings_.size() <= depth) {
        strings_.emplace_back(strings_.size() * factor_, ' ');
    }
    return strings_[depth];
}

} // namespace jemit::json
