#pragma once

#include "cache/CacheKey.hpp"
#include "cache/CacheStats.hpp"
#include "types/Comparison.hpp"

#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace md::cache {

// Caller-side fields that are never taken from a cached entry.
struct LookupContext {
    std::string label;
    std::filesystem::path targetRootPath;
};

// Bounded LRU of comparison results keyed on (path, mtime) pairs. A pair cached
// in one direction also answers the swapped lookup with added/removed swapped.
class ResultCache {
public:
    explicit ResultCache(std::size_t maxEntries = 1000);

    [[nodiscard]] std::optional<types::ComparisonResult> get(const CacheKeyParts& parts,
                                                             const std::optional<LookupContext>& context = std::nullopt);

    // Stores under the direct key only; reverse answers are derived on read.
    void set(const CacheKeyParts& parts, const types::ComparisonResult& result);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return maxEntries_; }
    void clear();

    [[nodiscard]] CacheStatsSnapshot stats() const;

private:
    struct Entry {
        std::string key;
        CacheKeyParts parts;
        types::ComparisonResult result;
    };

    using Order = std::list<Entry>;

    // front = least recently used
    Order order_;
    std::unordered_map<std::string, Order::iterator> index_;
    std::size_t maxEntries_;
    CacheStats stats_;
    mutable std::mutex mutex_;

    void touch(Order::iterator it);
    void evictIfNeeded();
};

}
