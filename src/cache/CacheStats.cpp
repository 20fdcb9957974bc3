#include "cache/CacheStats.hpp"

using namespace md::cache;

double CacheStatsSnapshot::hitRatio() const noexcept {
    const auto lookups = hits + misses;
    return lookups ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0;
}

void CacheStats::record_hit(const bool reversed) noexcept {
    hits.fetch_add(1, std::memory_order_relaxed);
    if (reversed) reverse_hits.fetch_add(1, std::memory_order_relaxed);
}

CacheStatsSnapshot CacheStats::snapshot(const uint64_t entries, const uint64_t capacity) const noexcept {
    CacheStatsSnapshot s;
    s.hits = hits.load(std::memory_order_relaxed);
    s.reverse_hits = reverse_hits.load(std::memory_order_relaxed);
    s.misses = misses.load(std::memory_order_relaxed);
    s.inserts = inserts.load(std::memory_order_relaxed);
    s.evictions = evictions.load(std::memory_order_relaxed);
    s.entries = entries;
    s.capacity = capacity;
    return s;
}
