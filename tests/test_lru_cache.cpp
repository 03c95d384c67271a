#include "cache/lru_cache.h"
#include <gtest/gtest.h>

using namespace rastile;

TEST(LruCacheTest, RejectsZeroCapacity) {
    EXPECT_THROW(LruCache<int>(0), std::invalid_argument);
    EXPECT_NO_THROW(LruCache<int>(1));
}

TEST(LruCacheTest, DefaultCapacity) {
    LruCache<int> cache;
    EXPECT_EQ(cache.max_size(), 500);
    EXPECT_EQ(cache.size(), 0);
}

TEST(LruCacheTest, EvictsLeastRecentlyUsed) {
    LruCache<int> cache(3);
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);
    ASSERT_EQ(cache.get("a"), 1);
    cache.set("d", 4);

    EXPECT_TRUE(cache.has("a"));
    EXPECT_FALSE(cache.has("b"));
    EXPECT_TRUE(cache.has("c"));
    EXPECT_TRUE(cache.has("d"));
    EXPECT_EQ(cache.stats().evictions, 1);
}

TEST(LruCacheTest, FirstInsertedEvictedWithoutAccess) {
    LruCache<int> cache(4);
    for (int i = 0; i < 5; i++) cache.set("k" + std::to_string(i), i);
    EXPECT_FALSE(cache.has("k0"));
    EXPECT_EQ(cache.size(), 4);
}

TEST(LruCacheTest, UpdatePromotesWithoutEviction) {
    LruCache<int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("a", 10);
    EXPECT_EQ(cache.stats().evictions, 0);
    EXPECT_EQ(cache.size(), 2);

    cache.set("c", 3);
    EXPECT_FALSE(cache.has("b"));
    EXPECT_EQ(cache.get("a"), 10);
}

TEST(LruCacheTest, StatsCountEveryGet) {
    LruCache<int> cache(2);
    EXPECT_EQ(cache.stats().hit_rate, 0.0);

    cache.set("a", 1);
    cache.get("a");
    cache.get("a");
    cache.get("a");
    cache.get("missing");

    CacheStats s = cache.stats();
    EXPECT_EQ(s.hits, 3);
    EXPECT_EQ(s.misses, 1);
    EXPECT_DOUBLE_EQ(s.hit_rate, 75.0);
    EXPECT_EQ(s.size, 1);
    EXPECT_EQ(s.max_size, 2);
}

TEST(LruCacheTest, HasAndRemoveLeaveStatsAlone) {
    LruCache<std::string> cache(2);
    cache.set("a", "x");
    EXPECT_TRUE(cache.has("a"));
    EXPECT_TRUE(cache.remove("a"));
    EXPECT_FALSE(cache.remove("a"));
    EXPECT_EQ(cache.stats().hits, 0);
    EXPECT_EQ(cache.stats().misses, 0);
}

TEST(LruCacheTest, ClearKeepsStatsUntilReset) {
    LruCache<int> cache(2);
    cache.set("a", 1);
    cache.get("a");
    cache.get("b");
    cache.clear();

    EXPECT_EQ(cache.size(), 0);
    EXPECT_EQ(cache.stats().hits, 1);
    EXPECT_EQ(cache.stats().misses, 1);

    cache.set("c", 3);
    cache.reset_stats();
    CacheStats s = cache.stats();
    EXPECT_EQ(s.hits, 0);
    EXPECT_EQ(s.misses, 0);
    EXPECT_EQ(s.evictions, 0);
    EXPECT_EQ(s.size, 1);
}
