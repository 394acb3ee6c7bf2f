/**
 * @file test_similarity.cpp
 * @brief Exhaustive cosine search over a record log and its index.
 *
 * Tests cover:
 *   - Best match above threshold, none below it.
 *   - Superseded records are not candidates.
 *   - Equal scores resolve to the earliest record in log order.
 *   - Zero-norm vectors and zero-norm queries never match.
 */

#include "embedcache/key_index.hpp"
#include "embedcache/record_log.hpp"
#include "embedcache/similarity.hpp"

#include <cmath>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace embedcache;

class SimilarityTest : public ::testing::Test {
protected:
  fs::path path_;
  RecordLog log_;
  KeyIndex index_;

  void SetUp() override {
    path_ = fs::temp_directory_path() / "test_similarity.bin";
    std::error_code ec;
    fs::remove(path_, ec);
    auto log = RecordLog::open(path_, 3);
    ASSERT_TRUE(log.has_value());
    log_ = std::move(*log);
  }

  void TearDown() override {
    (void)log_.close(false);
    std::error_code ec;
    fs::remove(path_, ec);
  }

  void put(const std::string &key, std::vector<float> v) {
    auto off = log_.append(key, v);
    ASSERT_TRUE(off.has_value());
    auto same_key = [this, &key](uint64_t o) -> Result<bool> {
      auto k = log_.read_key_at(o);
      if (!k)
        return std::unexpected(k.error());
      return *k == key;
    };
    ASSERT_TRUE(index_.put(key, *off, same_key).has_value());
  }

  std::optional<Match> best(std::vector<float> q, float threshold) {
    auto r = find_best_match(log_, index_, q, threshold);
    EXPECT_TRUE(r.has_value());
    return r ? std::move(*r) : std::nullopt;
  }
};

TEST_F(SimilarityTest, PicksClosestAboveThreshold) {
  put("hello", {1, 0, 0});
  put("world", {0, 1, 0});

  auto m = best({0.95f, 0.1f, 0.05f}, 0.90f);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->key, "hello");
  EXPECT_EQ(m->vector, (std::vector<float>{1, 0, 0}));
  EXPECT_NEAR(m->score, 0.95 / std::sqrt(0.915), 1e-5);
}

TEST_F(SimilarityTest, NothingReachesThreshold) {
  put("hello", {1, 0, 0});
  put("world", {0, 1, 0});
  EXPECT_FALSE(best({0, 0, 1}, 0.99f).has_value());
}

TEST_F(SimilarityTest, EmptyIndexHasNoMatch) {
  EXPECT_FALSE(best({1, 0, 0}, -1.0f).has_value());
}

TEST_F(SimilarityTest, ThresholdIsInclusive) {
  put("x", {1, 0, 0});
  EXPECT_TRUE(best({1, 0, 0}, 1.0f).has_value());
}

TEST_F(SimilarityTest, SupersededValueIsNotACandidate) {
  put("moved", {1, 0, 0});
  put("moved", {0, 1, 0});
  put("other", {0, 0.5f, 0.5f});

  auto m = best({1, 0, 0}, 0.5f);
  EXPECT_FALSE(m.has_value());

  auto y = best({0, 1, 0}, 0.9f);
  ASSERT_TRUE(y.has_value());
  EXPECT_EQ(y->key, "moved");
}

TEST_F(SimilarityTest, TiesKeepEarliestRecord) {
  put("first", {0, 2, 0});
  put("second", {0, 1, 0});
  put("third", {0, 3, 0});

  auto m = best({0, 1, 0}, 0.5f);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->key, "first");
}

TEST_F(SimilarityTest, ZeroNormRecordsAreSkipped) {
  put("zero", {0, 0, 0});
  put("neg", {-1, 0, 0});

  auto m = best({1, 0, 0}, -1.0f);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->key, "neg");
  EXPECT_NEAR(m->score, -1.0f, 1e-6f);
}

TEST_F(SimilarityTest, ZeroNormQueryMatchesNothing) {
  put("a", {1, 0, 0});
  EXPECT_FALSE(best({0, 0, 0}, -1.0f).has_value());
}

TEST_F(SimilarityTest, WrongQueryLengthIsDimensionMismatch) {
  put("a", {1, 0, 0});
  std::vector<float> q{1, 0};
  auto r = find_best_match(log_, index_, q, 0.0f);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::DimensionMismatch);
}
