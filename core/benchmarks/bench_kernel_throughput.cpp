// ===========================================================================
// Cosine Kernel Throughput
// ---------------------------------------------------------------------------
// One (dot, |a|², |b|²) pass per comparison, at common embedding widths.
// Every find_similar call runs this kernel once per live record, so its cost
// bounds exhaustive search latency.
//
// Methodology: fixed seeds, 1536-dim by default plus a 384..3072 sweep for
// the dispatched kernel.
// ===========================================================================

#include "embedcache/math_kernel.hpp"
#include "embedcache/simd_impl.hpp"
#include <benchmark/benchmark.h>
#include <random>
#include <span>
#include <vector>

namespace {

constexpr size_t DIM = 1536;

std::vector<float> generate_vector(size_t dim, int seed) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<float> v(dim);
  for (auto &f : v)
    f = dist(rng);
  return v;
}

} // namespace

// ---------------------------------------------------------------------------
// BM_Scalar: portable fallback
// ---------------------------------------------------------------------------
static void BM_Scalar(benchmark::State &state) {
  auto a = generate_vector(DIM, 42);
  auto b = generate_vector(DIM, 43);
  std::span<const float> sa{a}, sb{b};

  for (auto _ : state) {
    auto terms = embedcache::simd::cosine_terms_scalar(sa, sb);
    benchmark::DoNotOptimize(terms);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Scalar)->Unit(benchmark::kNanosecond);

// ---------------------------------------------------------------------------
// BM_SIMDe_AVX2: AVX2/FMA (native on x86, translated by SIMDe elsewhere)
// ---------------------------------------------------------------------------
static void BM_SIMDe_AVX2(benchmark::State &state) {
  auto a = generate_vector(DIM, 42);
  auto b = generate_vector(DIM, 43);
  std::span<const float> sa{a}, sb{b};

  for (auto _ : state) {
    auto terms = embedcache::simd::cosine_terms_avx2(sa, sb);
    benchmark::DoNotOptimize(terms);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SIMDe_AVX2)->Unit(benchmark::kNanosecond);

// ---------------------------------------------------------------------------
// BM_RuntimeDispatched: production path, including the final division
// ---------------------------------------------------------------------------
static void BM_RuntimeDispatched(benchmark::State &state) {
  const auto dim = static_cast<size_t>(state.range(0));
  auto a = generate_vector(dim, 42);
  auto b = generate_vector(dim, 43);
  std::span<const float> sa{a}, sb{b};

  for (auto _ : state) {
    auto sim = embedcache::math::cosine_similarity(sa, sb);
    benchmark::DoNotOptimize(sim);
  }
  state.SetItemsProcessed(state.iterations());
  state.SetBytesProcessed(state.iterations() * dim * 2 * sizeof(float));
  state.SetLabel(embedcache::simd::best_kernel_name());
}
BENCHMARK(BM_RuntimeDispatched)
    ->Arg(384)
    ->Arg(768)
    ->Arg(1536)
    ->Arg(3072)
    ->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
