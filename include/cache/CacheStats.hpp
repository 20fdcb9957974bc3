#pragma once

#include <atomic>
#include <cstdint>

namespace md::cache {

struct CacheStatsSnapshot {
    uint64_t hits{};
    uint64_t reverse_hits{};
    uint64_t misses{};
    uint64_t inserts{};
    uint64_t evictions{};
    uint64_t entries{};
    uint64_t capacity{};

    [[nodiscard]] double hitRatio() const noexcept;
};

struct CacheStats {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> reverse_hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> inserts{0};
    std::atomic<uint64_t> evictions{0};

    void record_hit(bool reversed) noexcept;
    void record_miss() noexcept { misses.fetch_add(1, std::memory_order_relaxed); }
    void record_insert() noexcept { inserts.fetch_add(1, std::memory_order_relaxed); }
    void record_eviction() noexcept { evictions.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] CacheStatsSnapshot snapshot(uint64_t entries, uint64_t capacity) const noexcept;
};

}
