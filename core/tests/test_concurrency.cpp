#include "embedcache/embedcache_c_api.h"
#include "embedcache/key_index.hpp"
#include "embedcache/store.hpp"
#include <atomic>
#include <cmath>
#include <filesystem>
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace embedcache;

namespace {

constexpr uint32_t DIM = 64;

/// Helper: generate a random normalized vector
std::vector<float> random_vector(std::mt19937 &rng) {
  std::vector<float> v(DIM);
  std::normal_distribution<float> dist(0.0f, 1.0f);
  for (auto &f : v)
    f = dist(rng);
  float norm = 0.0f;
  for (auto f : v)
    norm += f * f;
  norm = std::sqrt(norm);
  if (norm > 0)
    for (auto &f : v)
      f /= norm;
  return v;
}

/// Helper: a Store on a temporary file, removed with its snapshot
class TempStore {
public:
  explicit TempStore(size_t cache_capacity = 32) {
    path_ = std::filesystem::temp_directory_path() /
            ("embedcache_conc_" + std::to_string(counter_++) + ".cache");
    cleanup();
    StoreOptions opts;
    opts.dim = DIM;
    opts.cache_capacity = cache_capacity;
    auto store = Store::open(path_, opts);
    if (store)
      store_ = std::move(*store);
  }

  ~TempStore() {
    store_.reset();
    cleanup();
  }

  Store *get() { return store_.get(); }
  const std::filesystem::path &path() const { return path_; }

private:
  void cleanup() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    std::filesystem::remove(KeyIndex::snapshot_path_for(path_), ec);
  }

  static inline int counter_ = 0;
  std::filesystem::path path_;
  std::unique_ptr<Store> store_;
};

} // namespace

// ============================================================================
// Concurrent get + insert on one store (8 readers + 2 writers)
// ============================================================================

TEST(Concurrency, ReadersAndWritersOnOneStore) {
  TempStore ts;
  ASSERT_NE(ts.get(), nullptr);
  Store &store = *ts.get();

  std::mt19937 rng(42);
  std::vector<std::vector<float>> seeded;
  for (int i = 0; i < 100; ++i) {
    seeded.push_back(random_vector(rng));
    ASSERT_TRUE(store.insert("seed_" + std::to_string(i), seeded.back())
                    .has_value());
  }

  constexpr int NUM_READERS = 8;
  constexpr int NUM_WRITERS = 2;
  constexpr int WRITES_PER_WRITER = 200;
  std::atomic<bool> stop{false};
  std::atomic<int> read_errors{0};
  std::atomic<int> write_errors{0};
  std::vector<std::thread> threads;

  for (int r = 0; r < NUM_READERS; ++r) {
    threads.emplace_back([&, r] {
      std::mt19937 local(static_cast<unsigned>(r));
      std::uniform_int_distribution<int> pick(0, 99);
      while (!stop.load(std::memory_order_relaxed)) {
        const int i = pick(local);
        auto got = store.get("seed_" + std::to_string(i));
        if (!got || !got->has_value() || **got != seeded[i])
          read_errors.fetch_add(1);
        auto m = store.find_similar(seeded[i], 0.999f);
        if (!m || !m->has_value())
          read_errors.fetch_add(1);
      }
    });
  }

  std::vector<std::thread> writers;
  for (int w = 0; w < NUM_WRITERS; ++w) {
    writers.emplace_back([&, w] {
      std::mt19937 local(static_cast<unsigned>(100 + w));
      for (int i = 0; i < WRITES_PER_WRITER; ++i) {
        auto v = random_vector(local);
        auto key = "w" + std::to_string(w) + "_" + std::to_string(i);
        if (!store.insert(key, v))
          write_errors.fetch_add(1);
      }
    });
  }

  for (auto &t : writers)
    t.join();
  stop.store(true);
  for (auto &t : threads)
    t.join();

  EXPECT_EQ(read_errors.load(), 0);
  EXPECT_EQ(write_errors.load(), 0);

  auto stats = store.stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->records, 100u + NUM_WRITERS * WRITES_PER_WRITER);
  EXPECT_LE(stats->cache_size, 32u);
}

// ============================================================================
// Concurrent overwrites of the same key: last write wins, one live entry
// ============================================================================

TEST(Concurrency, SameKeyOverwrites) {
  TempStore ts;
  ASSERT_NE(ts.get(), nullptr);
  Store &store = *ts.get();

  constexpr int NUM_THREADS = 4;
  constexpr int WRITES = 250;
  std::vector<std::thread> threads;
  for (int t = 0; t < NUM_THREADS; ++t) {
    threads.emplace_back([&, t] {
      std::vector<float> v(DIM, static_cast<float>(t + 1));
      for (int i = 0; i < WRITES; ++i)
        EXPECT_TRUE(store.insert("shared", v).has_value());
    });
  }
  for (auto &t : threads)
    t.join();

  auto stats = store.stats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->records, 1u);

  auto got = store.get("shared");
  ASSERT_TRUE(got.has_value());
  ASSERT_TRUE(got->has_value());
  const float x = (**got)[0];
  EXPECT_GE(x, 1.0f);
  EXPECT_LE(x, static_cast<float>(NUM_THREADS));
  for (float f : **got)
    EXPECT_EQ(f, x); // never a mix of two writes
}

// ============================================================================
// Independent handles through the C ABI from separate threads
// ============================================================================

TEST(Concurrency, DistinctHandlesInParallel) {
  constexpr int NUM_STORES = 6;
  std::vector<std::string> paths;
  for (int i = 0; i < NUM_STORES; ++i) {
    auto p = std::filesystem::temp_directory_path() /
             ("embedcache_conc_handle_" + std::to_string(i) + ".cache");
    std::error_code ec;
    std::filesystem::remove(p, ec);
    std::filesystem::remove(KeyIndex::snapshot_path_for(p), ec);
    paths.push_back(p.string());
  }

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < NUM_STORES; ++i) {
    threads.emplace_back([&, i] {
      for (int round = 0; round < 5; ++round) {
        int32_t h = embedcache_open(paths[i].c_str(), 4);
        if (h <= 0) {
          failures.fetch_add(1);
          return;
        }
        const float v[4] = {static_cast<float>(i), 1, 2,
                            static_cast<float>(round)};
        const std::string key = "r" + std::to_string(round);
        if (embedcache_insert(h, key.data(), key.size(), v, 4) !=
            EMBEDCACHE_OK)
          failures.fetch_add(1);
        embedcache_stats_t s{};
        if (embedcache_get_stats_struct(h, &s) != EMBEDCACHE_OK ||
            s.records != static_cast<uint64_t>(round + 1))
          failures.fetch_add(1);
        if (embedcache_close(h) != EMBEDCACHE_OK)
          failures.fetch_add(1);
      }
    });
  }
  for (auto &t : threads)
    t.join();
  EXPECT_EQ(failures.load(), 0);

  for (const auto &p : paths) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
    std::filesystem::remove(KeyIndex::snapshot_path_for(p), ec);
  }
}

// ============================================================================
// Racing opens of one path: exactly one wins
// ============================================================================

TEST(Concurrency, RacingOpensOfOnePath) {
  const auto path =
      std::filesystem::temp_directory_path() / "embedcache_conc_race.cache";
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(KeyIndex::snapshot_path_for(path), ec);
  const std::string p = path.string();

  constexpr int NUM_THREADS = 8;
  std::atomic<int> winners{0};
  std::atomic<int32_t> winning_handle{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < NUM_THREADS; ++t) {
    threads.emplace_back([&] {
      int32_t h = embedcache_open(p.c_str(), 8);
      if (h > 0) {
        winners.fetch_add(1);
        winning_handle.store(h);
      } else {
        EXPECT_EQ(h, EMBEDCACHE_ERR_INVALID_ARG);
      }
    });
  }
  for (auto &t : threads)
    t.join();

  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(embedcache_close(winning_handle.load()), EMBEDCACHE_OK);
  std::filesystem::remove(path, ec);
  std::filesystem::remove(KeyIndex::snapshot_path_for(path), ec);
}
