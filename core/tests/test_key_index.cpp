/**
 * @file test_key_index.cpp
 * @brief Unit tests for the key → offset index and its snapshot file.
 */

#include "embedcache/hash.hpp"
#include "embedcache/key_index.hpp"
#include "embedcache/schema.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace embedcache;

namespace {

/// Stand-in for the record log: offset → key.
struct FakeLog {
  std::map<uint64_t, std::string> keys;
  int probes = 0;

  auto matcher(std::string_view key) {
    return [this, key](uint64_t off) -> Result<bool> {
      ++probes;
      auto it = keys.find(off);
      if (it == keys.end())
        return std::unexpected(Error::Corruption);
      return it->second == key;
    };
  }

  Result<bool> put(KeyIndex &index, const std::string &key, uint64_t off) {
    keys[off] = key;
    return index.put(key, off, matcher(key));
  }
};

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lookup
// ═══════════════════════════════════════════════════════════════════════════

TEST(KeyIndexTest, PutThenFind) {
  KeyIndex index;
  FakeLog log;

  auto fresh = log.put(index, "hello", 64);
  ASSERT_TRUE(fresh.has_value());
  EXPECT_TRUE(*fresh);

  auto found = index.find("hello", log.matcher("hello"));
  ASSERT_TRUE(found.has_value());
  ASSERT_TRUE(found->has_value());
  EXPECT_EQ(**found, 64u);

  auto missing = index.find("world", log.matcher("world"));
  ASSERT_TRUE(missing.has_value());
  EXPECT_FALSE(missing->has_value());
}

TEST(KeyIndexTest, OverwriteKeepsOneEntry) {
  KeyIndex index;
  FakeLog log;

  ASSERT_TRUE(log.put(index, "k", 64).has_value());
  auto second = log.put(index, "k", 200);
  ASSERT_TRUE(second.has_value());
  EXPECT_FALSE(*second);

  EXPECT_EQ(index.size(), 1u);
  EXPECT_EQ(index.memory_bytes(), 16u);
  EXPECT_EQ(**index.find("k", log.matcher("k")), 200u);
}

TEST(KeyIndexTest, HashHitWithDifferentKeyIsAMiss) {
  KeyIndex index;
  FakeLog log;
  ASSERT_TRUE(log.put(index, "stored", 64).has_value());

  // Pretend the record at 64 holds a different key than the one hashed:
  // the matcher has the final word, not the hash.
  log.keys[64] = "something else";
  auto found = index.find("stored", log.matcher("stored"));
  ASSERT_TRUE(found.has_value());
  EXPECT_FALSE(found->has_value());
  EXPECT_EQ(log.probes, 1);
}

TEST(KeyIndexTest, CollidingEntriesAreDisambiguatedByMatcher) {
  KeyIndex index;
  FakeLog log;

  // Two distinct keys forced under the same hash bucket via assign().
  log.keys[64] = "first";
  log.keys[128] = "second";
  index.assign("first", std::nullopt, 64);
  index.assign("first", std::nullopt, 128); // same hash, second record

  auto found = index.find("first", log.matcher("second"));
  ASSERT_TRUE(found.has_value());
  ASSERT_TRUE(found->has_value());
  EXPECT_EQ(**found, 128u);
  EXPECT_EQ(index.size(), 2u);
}

TEST(KeyIndexTest, MatcherErrorPropagates) {
  KeyIndex index;
  FakeLog log;
  ASSERT_TRUE(log.put(index, "k", 64).has_value());
  log.keys.clear();

  auto found = index.find("k", log.matcher("k"));
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error(), Error::Corruption);
}

TEST(KeyIndexTest, SortedOffsetsFollowLogOrder) {
  KeyIndex index;
  FakeLog log;
  ASSERT_TRUE(log.put(index, "c", 300).has_value());
  ASSERT_TRUE(log.put(index, "a", 64).has_value());
  ASSERT_TRUE(log.put(index, "b", 150).has_value());

  EXPECT_EQ(index.sorted_offsets(), (std::vector<uint64_t>{64, 150, 300}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Snapshot
// ═══════════════════════════════════════════════════════════════════════════

class KeyIndexSnapshotTest : public ::testing::Test {
protected:
  fs::path path_;
  static constexpr uint64_t LOG_LENGTH = 4096;

  void SetUp() override {
    path_ = fs::temp_directory_path() / "test_key_index.bin.idx";
    std::error_code ec;
    fs::remove(path_, ec);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove(path_, ec);
  }

  KeyIndex make_index(FakeLog &log) {
    KeyIndex index;
    for (int i = 0; i < 20; ++i) {
      auto r = log.put(index, "key_" + std::to_string(i),
                       64 + static_cast<uint64_t>(i) * 100);
      EXPECT_TRUE(r.has_value());
    }
    return index;
  }
};

TEST_F(KeyIndexSnapshotTest, SnapshotPathAppendsSuffix) {
  EXPECT_EQ(KeyIndex::snapshot_path_for("/tmp/a.cache").string(),
            "/tmp/a.cache.idx");
}

TEST_F(KeyIndexSnapshotTest, SaveAndLoadReproduceLookups) {
  FakeLog log;
  KeyIndex original = make_index(log);
  ASSERT_TRUE(original.save_snapshot(path_, 8, LOG_LENGTH).has_value());
  EXPECT_EQ(fs::file_size(path_),
            sizeof(SnapshotHeader) + 20 * sizeof(SnapshotEntry));

  KeyIndex loaded;
  ASSERT_TRUE(loaded.load_snapshot(path_, 8, LOG_LENGTH).has_value());
  EXPECT_EQ(loaded.size(), original.size());
  EXPECT_EQ(loaded.sorted_offsets(), original.sorted_offsets());

  for (int i = 0; i < 20; ++i) {
    const std::string key = "key_" + std::to_string(i);
    EXPECT_EQ(**loaded.find(key, log.matcher(key)),
              **original.find(key, log.matcher(key)));
  }

  // No temporary left behind.
  fs::path tmp = path_;
  tmp += SNAPSHOT_TMP_SUFFIX;
  EXPECT_FALSE(fs::exists(tmp));
}

TEST_F(KeyIndexSnapshotTest, StaleLogLengthIsRejected) {
  FakeLog log;
  KeyIndex original = make_index(log);
  ASSERT_TRUE(original.save_snapshot(path_, 8, LOG_LENGTH).has_value());

  KeyIndex loaded;
  auto r = loaded.load_snapshot(path_, 8, LOG_LENGTH + 100);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidFormat);
  EXPECT_TRUE(loaded.empty());
}

TEST_F(KeyIndexSnapshotTest, DimensionMismatchIsRejected) {
  FakeLog log;
  KeyIndex original = make_index(log);
  ASSERT_TRUE(original.save_snapshot(path_, 8, LOG_LENGTH).has_value());

  KeyIndex loaded;
  EXPECT_FALSE(loaded.load_snapshot(path_, 16, LOG_LENGTH).has_value());
}

TEST_F(KeyIndexSnapshotTest, FlippedEntryByteFailsChecksum) {
  FakeLog log;
  KeyIndex original = make_index(log);
  ASSERT_TRUE(original.save_snapshot(path_, 8, LOG_LENGTH).has_value());

  {
    std::fstream f(path_, std::ios::binary | std::ios::in | std::ios::out);
    f.seekp(sizeof(SnapshotHeader) + 3);
    char c = 0x5A;
    f.write(&c, 1);
  }

  KeyIndex loaded;
  auto r = loaded.load_snapshot(path_, 8, LOG_LENGTH);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::Corruption);
}

TEST_F(KeyIndexSnapshotTest, TruncatedSnapshotIsRejected) {
  FakeLog log;
  KeyIndex original = make_index(log);
  ASSERT_TRUE(original.save_snapshot(path_, 8, LOG_LENGTH).has_value());
  fs::resize_file(path_, fs::file_size(path_) - 8);

  KeyIndex loaded;
  EXPECT_FALSE(loaded.load_snapshot(path_, 8, LOG_LENGTH).has_value());
}

TEST_F(KeyIndexSnapshotTest, OffsetOutsideLogIsRejected) {
  FakeLog log;
  KeyIndex original = make_index(log);
  // Entries reach offset 1964; claim a log shorter than that.
  ASSERT_TRUE(original.save_snapshot(path_, 8, 1000).has_value());

  KeyIndex loaded;
  auto r = loaded.load_snapshot(path_, 8, 1000);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::Corruption);
}

TEST_F(KeyIndexSnapshotTest, MissingFileIsIOError) {
  KeyIndex loaded;
  auto r = loaded.load_snapshot(path_, 8, LOG_LENGTH);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::IOError);
}
