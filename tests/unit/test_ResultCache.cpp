#include <gtest/gtest.h>
#include "cache/ResultCache.hpp"

using namespace md::cache;
using namespace md::types;

class ResultCacheTest : public ::testing::Test {
protected:
    static CacheKeyParts key(const std::string& base, const std::string& compare, const int64_t mtime = 100) {
        return {base, mtime, compare, mtime + 1, false};
    }

    static ComparisonResult result(const std::string& label, const std::string& path, const std::size_t added,
                                   const std::size_t removed) {
        return {label, DiffCounts{added, removed}, path, true, "/root/" + label};
    }
};

TEST_F(ResultCacheTest, DirectHitReturnsStoredResult) {
    ResultCache cache(10);
    const auto r = result("alpha", "/ws/alpha/f.txt", 2, 3);
    cache.set(key("/ref/f.txt", "/ws/alpha/f.txt"), r);

    const auto hit = cache.get(key("/ref/f.txt", "/ws/alpha/f.txt"));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, r);
}

TEST_F(ResultCacheTest, DirectHitTakesLabelAndRootFromCaller) {
    ResultCache cache(10);
    cache.set(key("/ref/f.txt", "/ws/alpha/f.txt"), result("alpha", "/ws/alpha/f.txt", 2, 3));

    const auto hit = cache.get(key("/ref/f.txt", "/ws/alpha/f.txt"), LookupContext{"renamed", "/elsewhere"});
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->label, "renamed");
    EXPECT_EQ(hit->targetRootPath, "/elsewhere");
    EXPECT_EQ(hit->counts, (DiffCounts{2, 3}));
    EXPECT_EQ(hit->resolvedTargetPath, "/ws/alpha/f.txt");
}

TEST_F(ResultCacheTest, ReturnedCopyCannotCorruptCache) {
    ResultCache cache(10);
    const auto parts = key("/ref/f.txt", "/ws/alpha/f.txt");
    cache.set(parts, result("alpha", "/ws/alpha/f.txt", 2, 3));

    auto first = cache.get(parts);
    ASSERT_TRUE(first.has_value());
    first->setCounts({99, 99});
    first->label = "mutated";

    const auto second = cache.get(parts);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->counts, (DiffCounts{2, 3}));
    EXPECT_EQ(second->label, "alpha");
}

TEST_F(ResultCacheTest, ReverseLookupSwapsCounts) {
    ResultCache cache(10);
    const CacheKeyParts forward{"/p1", 10, "/p2", 20, false};
    cache.set(forward, result("p2", "/p2", 2, 3));

    const CacheKeyParts backward{"/p2", 20, "/p1", 10, false};
    const auto hit = cache.get(backward, LookupContext{"p1", "/root-p1"});
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->counts, (DiffCounts{3, 2}));
    EXPECT_EQ(hit->totalChangedLines, 5u);
    EXPECT_EQ(hit->resolvedTargetPath, "/p1");
    EXPECT_TRUE(hit->exists);
    EXPECT_EQ(hit->label, "p1");
    EXPECT_EQ(hit->targetRootPath, "/root-p1");

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.stats().reverse_hits, 1u);
}

TEST_F(ResultCacheTest, ReverseLookupRequiresMatchingMtimes) {
    ResultCache cache(10);
    cache.set({"/p1", 10, "/p2", 20, false}, result("p2", "/p2", 2, 3));
    EXPECT_FALSE(cache.get({"/p2", 21, "/p1", 10, false}).has_value());
}

TEST_F(ResultCacheTest, WhitespaceModeIsPartOfTheKey) {
    ResultCache cache(10);
    cache.set({"/a", 1, "/b", 2, false}, result("b", "/b", 1, 1));
    EXPECT_FALSE(cache.get({"/a", 1, "/b", 2, true}).has_value());
    EXPECT_TRUE(cache.get({"/a", 1, "/b", 2, false}).has_value());
}

TEST_F(ResultCacheTest, NewMtimeMisses) {
    ResultCache cache(10);
    cache.set(key("/ref", "/t", 100), result("t", "/t", 1, 0));
    EXPECT_FALSE(cache.get(key("/ref", "/t", 200)).has_value());
    EXPECT_EQ(cache.stats().misses, 1u);
}

TEST_F(ResultCacheTest, EvictsLeastRecentlyInsertedWhenNotRead) {
    ResultCache cache(3);
    for (int i = 0; i < 4; ++i)
        cache.set(key("/ref", "/t" + std::to_string(i)), result("t", "/t" + std::to_string(i), 1, 0));

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.get(key("/ref", "/t0")).has_value());
    EXPECT_TRUE(cache.get(key("/ref", "/t3")).has_value());
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST_F(ResultCacheTest, EvictionFollowsAccessOrder) {
    ResultCache cache(3);
    cache.set(key("/ref", "/t0"), result("t", "/t0", 1, 0));
    cache.set(key("/ref", "/t1"), result("t", "/t1", 1, 0));
    cache.set(key("/ref", "/t2"), result("t", "/t2", 1, 0));

    // t0 becomes most recently used, t1 is now the oldest
    ASSERT_TRUE(cache.get(key("/ref", "/t0")).has_value());
    cache.set(key("/ref", "/t3"), result("t", "/t3", 1, 0));

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_TRUE(cache.get(key("/ref", "/t0")).has_value());
    EXPECT_FALSE(cache.get(key("/ref", "/t1")).has_value());
    EXPECT_TRUE(cache.get(key("/ref", "/t2")).has_value());
    EXPECT_TRUE(cache.get(key("/ref", "/t3")).has_value());
}

TEST_F(ResultCacheTest, ReverseHitAlsoRefreshesRecency) {
    ResultCache cache(2);
    cache.set({"/a", 1, "/b", 2, false}, result("b", "/b", 1, 0));
    cache.set({"/a", 1, "/c", 3, false}, result("c", "/c", 1, 0));

    ASSERT_TRUE(cache.get({"/b", 2, "/a", 1, false}).has_value());
    cache.set({"/a", 1, "/d", 4, false}, result("d", "/d", 1, 0));

    EXPECT_TRUE(cache.get({"/a", 1, "/b", 2, false}).has_value());
    EXPECT_FALSE(cache.get({"/a", 1, "/c", 3, false}).has_value());
}

TEST_F(ResultCacheTest, SetNeverStoresTheReverseKey) {
    ResultCache cache(10);
    cache.set({"/a", 1, "/b", 2, false}, result("b", "/b", 1, 0));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(makeCacheKey({"/a", 1, "/b", 2, false}), "v1|iw:0|b:/a|bm:1|c:/b|cm:2");
}

TEST_F(ResultCacheTest, OverwriteKeepsSingleEntry) {
    ResultCache cache(10);
    cache.set(key("/ref", "/t"), result("t", "/t", 1, 0));
    cache.set(key("/ref", "/t"), result("t", "/t", 4, 4));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get(key("/ref", "/t"))->counts, (DiffCounts{4, 4}));
}

TEST_F(ResultCacheTest, StatsTrackLookupsAndHitRatio) {
    ResultCache cache(10);
    EXPECT_DOUBLE_EQ(cache.stats().hitRatio(), 0.0);

    cache.set(key("/ref", "/t"), result("t", "/t", 1, 0));
    ASSERT_TRUE(cache.get(key("/ref", "/t")).has_value());
    ASSERT_TRUE(cache.get({"/t", 101, "/ref", 100, false}).has_value());
    EXPECT_FALSE(cache.get(key("/ref", "/other")).has_value());

    const auto s = cache.stats();
    EXPECT_EQ(s.hits, 2u);
    EXPECT_EQ(s.reverse_hits, 1u);
    EXPECT_EQ(s.misses, 1u);
    EXPECT_EQ(s.inserts, 1u);
    EXPECT_EQ(s.entries, 1u);
    EXPECT_EQ(s.capacity, 10u);
    EXPECT_DOUBLE_EQ(s.hitRatio(), 2.0 / 3.0);
}

TEST_F(ResultCacheTest, ClearDropsEntriesButKeepsCounters) {
    ResultCache cache(10);
    cache.set(key("/ref", "/a"), result("a", "/a", 1, 0));
    cache.set(key("/ref", "/b"), result("b", "/b", 0, 1));
    ASSERT_TRUE(cache.get(key("/ref", "/a")).has_value());

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get(key("/ref", "/a")).has_value());
    EXPECT_FALSE(cache.get({"/a", 101, "/ref", 100, false}).has_value());

    const auto s = cache.stats();
    EXPECT_EQ(s.entries, 0u);
    EXPECT_EQ(s.inserts, 2u);
    EXPECT_EQ(s.hits, 1u);
    EXPECT_EQ(s.misses, 1u);

    cache.set(key("/ref", "/a"), result("a", "/a", 3, 3));
    EXPECT_EQ(cache.get(key("/ref", "/a"))->counts, (DiffCounts{3, 3}));
}
