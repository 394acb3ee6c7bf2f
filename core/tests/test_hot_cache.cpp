/**
 * @file test_hot_cache.cpp
 * @brief Unit tests for the LRU hot vector cache.
 */

#include "embedcache/hot_cache.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using embedcache::HotCache;

namespace {
std::vector<float> vec(float x) { return {x, x + 1.0f}; }
} // namespace

TEST(HotCacheTest, GetReturnsCopyOfPut) {
  HotCache cache(4);
  auto v = vec(1.0f);
  cache.put("a", v);

  auto hit = cache.get("a");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, v);
  EXPECT_FALSE(cache.get("b").has_value());
}

TEST(HotCacheTest, EvictsLeastRecentlyInserted) {
  HotCache cache(3);
  cache.put("a", vec(1));
  cache.put("b", vec(2));
  cache.put("c", vec(3));
  cache.put("d", vec(4));

  EXPECT_EQ(cache.size(), 3u);
  EXPECT_FALSE(cache.contains("a"));
  EXPECT_TRUE(cache.contains("b"));
  EXPECT_TRUE(cache.contains("d"));
}

TEST(HotCacheTest, GetRefreshesRecency) {
  HotCache cache(3);
  cache.put("a", vec(1));
  cache.put("b", vec(2));
  cache.put("c", vec(3));

  ASSERT_TRUE(cache.get("a").has_value());
  cache.put("d", vec(4));

  EXPECT_TRUE(cache.contains("a"));
  EXPECT_FALSE(cache.contains("b"));
  EXPECT_EQ(cache.keys_by_recency(),
            (std::vector<std::string>{"d", "a", "c"}));
}

TEST(HotCacheTest, MissHasNoSideEffects) {
  HotCache cache(2);
  cache.put("a", vec(1));
  cache.put("b", vec(2));
  EXPECT_FALSE(cache.get("zzz").has_value());
  EXPECT_EQ(cache.keys_by_recency(), (std::vector<std::string>{"b", "a"}));
}

TEST(HotCacheTest, ContainsDoesNotTouchRecency) {
  HotCache cache(2);
  cache.put("a", vec(1));
  cache.put("b", vec(2));
  EXPECT_TRUE(cache.contains("a"));
  cache.put("c", vec(3));
  EXPECT_FALSE(cache.contains("a"));
}

TEST(HotCacheTest, PutExistingReplacesAndRefreshes) {
  HotCache cache(2);
  cache.put("a", vec(1));
  cache.put("b", vec(2));
  cache.put("a", vec(10));

  EXPECT_EQ(cache.size(), 2u);
  EXPECT_EQ(*cache.get("a"), vec(10));
  cache.put("c", vec(3));
  EXPECT_FALSE(cache.contains("b"));
  EXPECT_TRUE(cache.contains("a"));
}

TEST(HotCacheTest, ZeroCapacityDisablesCache) {
  HotCache cache(0);
  cache.put("a", vec(1));
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.get("a").has_value());
}

TEST(HotCacheTest, NeverExceedsCapacity) {
  HotCache cache(16);
  for (int i = 0; i < 1000; ++i) {
    cache.put("k" + std::to_string(i), vec(static_cast<float>(i)));
    ASSERT_LE(cache.size(), 16u);
  }
  // The survivors are exactly the 16 most recent insertions.
  for (int i = 984; i < 1000; ++i)
    EXPECT_TRUE(cache.contains("k" + std::to_string(i)));
}

TEST(HotCacheTest, ClearEmpties) {
  HotCache cache(4);
  cache.put("a", vec(1));
  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_EQ(cache.capacity(), 4u);
  EXPECT_FALSE(cache.contains("a"));
}
