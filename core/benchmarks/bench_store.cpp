// ===========================================================================
// Store Latency: insert, hot/cold get, exhaustive find_similar
// ---------------------------------------------------------------------------
//   - Insert:        one record append + index update + cache refresh.
//   - HotGet:        key resident in the hot cache (no file access).
//   - ColdGet:       cache disabled; one positioned read per lookup.
//   - FindSimilar:   linear scan, one record read + one cosine per live key.
//   - Reopen:        index recovery from snapshot vs. full log scan.
//
// Methodology: 1536-dim vectors, fixed seeds, files under temp_directory_path.
// ===========================================================================

#include "embedcache/key_index.hpp"
#include "embedcache/store.hpp"
#include <benchmark/benchmark.h>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

constexpr uint32_t DIM = 1536;

std::vector<float> generate_vector(size_t dim, int seed) {
  std::mt19937 rng(static_cast<unsigned>(seed));
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<float> v(dim);
  for (auto &f : v)
    f = dist(rng);
  return v;
}

std::filesystem::path bench_path(const char *name) {
  return std::filesystem::temp_directory_path() / name;
}

void remove_store_files(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(embedcache::KeyIndex::snapshot_path_for(path), ec);
}

std::unique_ptr<embedcache::Store>
open_store(const std::filesystem::path &path, size_t cache_capacity,
           bool persist_snapshot = false) {
  embedcache::StoreOptions opts;
  opts.dim = DIM;
  opts.cache_capacity = cache_capacity;
  opts.persist_snapshot = persist_snapshot;
  opts.sync_on_close = false;
  auto store = embedcache::Store::open(path, opts);
  return store ? std::move(*store) : nullptr;
}

/// Fills a store with `n` keys "key_<i>".
bool populate(embedcache::Store &store, int64_t n) {
  for (int64_t i = 0; i < n; ++i) {
    auto v = generate_vector(DIM, static_cast<int>(i));
    if (!store.insert("key_" + std::to_string(i), v))
      return false;
  }
  return true;
}

} // namespace

// ---------------------------------------------------------------------------
// BM_Insert: append throughput (distinct keys)
// ---------------------------------------------------------------------------
static void BM_Insert(benchmark::State &state) {
  const auto path = bench_path("bench_store_insert.cache");
  remove_store_files(path);
  auto store = open_store(path, embedcache::CACHE_CAPACITY_DEFAULT);
  if (!store) {
    state.SkipWithError("open failed");
    return;
  }

  std::vector<std::vector<float>> vecs;
  for (int i = 0; i < 64; ++i)
    vecs.push_back(generate_vector(DIM, i));

  int64_t i = 0;
  for (auto _ : state) {
    auto r = store->insert("key_" + std::to_string(i), vecs[i % 64]);
    benchmark::DoNotOptimize(r);
    ++i;
  }
  state.SetItemsProcessed(state.iterations());
  state.SetBytesProcessed(state.iterations() * DIM * sizeof(float));

  store.reset();
  remove_store_files(path);
}
BENCHMARK(BM_Insert)->Unit(benchmark::kMicrosecond);

// ---------------------------------------------------------------------------
// BM_HotGet / BM_ColdGet: cache hit vs. log read
// ---------------------------------------------------------------------------
static void run_get(benchmark::State &state, size_t cache_capacity,
                    const char *file) {
  constexpr int64_t N = 1000;
  const auto path = bench_path(file);
  remove_store_files(path);
  auto store = open_store(path, cache_capacity);
  if (!store || !populate(*store, N)) {
    state.SkipWithError("setup failed");
    return;
  }

  // Hot: cycle over keys that fit in the cache. Cold: cycle over all.
  const int64_t span = cache_capacity > 0
                           ? static_cast<int64_t>(cache_capacity)
                           : N;
  std::vector<std::string> keys;
  for (int64_t i = N - span; i < N; ++i)
    keys.push_back("key_" + std::to_string(i));

  size_t i = 0;
  for (auto _ : state) {
    auto v = store->get(keys[i++ % keys.size()]);
    benchmark::DoNotOptimize(v);
  }
  state.SetItemsProcessed(state.iterations());

  store.reset();
  remove_store_files(path);
}

static void BM_HotGet(benchmark::State &state) {
  run_get(state, 100, "bench_store_hot.cache");
}
BENCHMARK(BM_HotGet)->Unit(benchmark::kNanosecond);

static void BM_ColdGet(benchmark::State &state) {
  run_get(state, 0, "bench_store_cold.cache");
}
BENCHMARK(BM_ColdGet)->Unit(benchmark::kMicrosecond);

// ---------------------------------------------------------------------------
// BM_FindSimilar: exhaustive scan, scaling with live record count
// ---------------------------------------------------------------------------
static void BM_FindSimilar(benchmark::State &state) {
  const int64_t n = state.range(0);
  const auto path = bench_path("bench_store_similar.cache");
  remove_store_files(path);
  auto store = open_store(path, embedcache::CACHE_CAPACITY_DEFAULT);
  if (!store || !populate(*store, n)) {
    state.SkipWithError("setup failed");
    return;
  }

  auto query = generate_vector(DIM, 999'999);
  for (auto _ : state) {
    auto m = store->find_similar(query, 0.0f);
    benchmark::DoNotOptimize(m);
  }
  state.SetItemsProcessed(state.iterations() * n);
  state.counters["records"] = static_cast<double>(n);

  store.reset();
  remove_store_files(path);
}
BENCHMARK(BM_FindSimilar)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(benchmark::kMillisecond);

// ---------------------------------------------------------------------------
// BM_Reopen: snapshot load vs. full log scan at open
// ---------------------------------------------------------------------------
static void BM_Reopen(benchmark::State &state) {
  constexpr int64_t N = 5000;
  const bool with_snapshot = state.range(0) != 0;
  const auto path = bench_path("bench_store_reopen.cache");
  remove_store_files(path);
  {
    auto store = open_store(path, 0, with_snapshot);
    if (!store || !populate(*store, N)) {
      state.SkipWithError("setup failed");
      return;
    }
  }

  for (auto _ : state) {
    auto store = open_store(path, 0, with_snapshot);
    if (!store) {
      state.SkipWithError("reopen failed");
      break;
    }
    benchmark::DoNotOptimize(store);
  }
  state.SetLabel(with_snapshot ? "snapshot" : "log scan");

  remove_store_files(path);
}
BENCHMARK(BM_Reopen)->Arg(1)->Arg(0)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
