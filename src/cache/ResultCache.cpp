#include "cache/ResultCache.hpp"
#include "logging/LogRegistry.hpp"

using namespace md::cache;
using namespace md::types;
using namespace md::logging;

ResultCache::ResultCache(const std::size_t maxEntries) : maxEntries_(maxEntries) {}

std::optional<ComparisonResult> ResultCache::get(const CacheKeyParts& parts, const std::optional<LookupContext>& context) {
    std::scoped_lock lock(mutex_);

    if (const auto it = index_.find(makeCacheKey(parts)); it != index_.end()) {
        touch(it->second);
        stats_.record_hit(false);

        auto copy = it->second->result;
        if (context) {
            copy.label = context->label;
            copy.targetRootPath = context->targetRootPath;
        }
        return copy;
    }

    const auto reversedParts = parts.reversed();
    if (const auto it = index_.find(makeCacheKey(reversedParts)); it != index_.end()) {
        touch(it->second);
        stats_.record_hit(true);

        // Only the counts survive a change of direction.
        const auto& cached = it->second->result;
        ComparisonResult r(context ? context->label : std::string{},
                           cached.counts.swapped(),
                           parts.comparePath,
                           parts.compareMtime >= 0,
                           context ? context->targetRootPath : std::filesystem::path{});
        LogRegistry::cache()->trace("[ResultCache] Reverse hit for {}", parts.comparePath.string());
        return r;
    }

    stats_.record_miss();
    return std::nullopt;
}

void ResultCache::set(const CacheKeyParts& parts, const ComparisonResult& result) {
    std::scoped_lock lock(mutex_);

    auto key = makeCacheKey(parts);
    if (const auto it = index_.find(key); it != index_.end()) {
        it->second->parts = parts;
        it->second->result = result;
        touch(it->second);
    } else {
        order_.push_back(Entry{key, parts, result});
        index_.emplace(std::move(key), std::prev(order_.end()));
    }

    stats_.record_insert();
    evictIfNeeded();
}

std::size_t ResultCache::size() const {
    std::scoped_lock lock(mutex_);
    return index_.size();
}

void ResultCache::clear() {
    std::scoped_lock lock(mutex_);
    order_.clear();
    index_.clear();
}

CacheStatsSnapshot ResultCache::stats() const {
    std::scoped_lock lock(mutex_);
    return stats_.snapshot(index_.size(), maxEntries_);
}

void ResultCache::touch(const Order::iterator it) {
    order_.splice(order_.end(), order_, it);
}

void ResultCache::evictIfNeeded() {
    while (index_.size() > maxEntries_ && !order_.empty()) {
        const auto& victim = order_.front();
        LogRegistry::cache()->debug("[ResultCache] Evicting {}", victim.key);
        index_.erase(victim.key);
        order_.pop_front();
        stats_.record_eviction();
    }
}
