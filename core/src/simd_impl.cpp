#include "embedcache/simd_impl.hpp"

// ---------------------------------------------------------------------------
// SIMDe: Portable SIMD. Translates AVX2 intrinsics to whatever the target
// offers (native AVX2, SSE, or NEON on Apple Silicon), so the same x86 code
// path compiles everywhere.
// See: https://github.com/simd-everywhere/simde
// ---------------------------------------------------------------------------
#define SIMDE_ENABLE_NATIVE_ALIASES
#include <simde/x86/avx2.h>
#include <simde/x86/fma.h>
#include <simde/x86/sse.h>

namespace embedcache::simd {

// ----------------------------------------------------------------------------
// 1. Scalar Implementation (baseline, no SIMD)
// ----------------------------------------------------------------------------
CosineTerms cosine_terms_scalar(std::span<const float> a,
                                std::span<const float> b) {
  float dot = 0.0f;
  float norm_a = 0.0f;
  float norm_b = 0.0f;
  size_t n = a.size();

  for (size_t i = 0; i < n; ++i) {
    float val_a = a[i];
    float val_b = b[i];
    dot += val_a * val_b;
    norm_a += val_a * val_a;
    norm_b += val_b * val_b;
  }
  return {dot, norm_a, norm_b};
}

// ----------------------------------------------------------------------------
// 2. AVX2 Implementation (via SIMDe)
// ----------------------------------------------------------------------------

// Helper for horizontal sum of 256-bit register
static inline float hsum256_ps(__m256 v) {
  __m128 lo = _mm256_castps256_ps128(v);
  __m128 hi = _mm256_extractf128_ps(v, 1);
  __m128 sum = _mm_add_ps(lo, hi);
  __m128 shuf = _mm_movehdup_ps(sum);
  __m128 sums = _mm_add_ps(sum, shuf);
  shuf = _mm_movehl_ps(shuf, sums);
  sums = _mm_add_ss(sums, shuf);
  return _mm_cvtss_f32(sums);
}

CosineTerms cosine_terms_avx2(std::span<const float> a,
                              std::span<const float> b) {
  size_t n = a.size();
  size_t i = 0;

  __m256 sum_dot = _mm256_setzero_ps();
  __m256 sum_aa = _mm256_setzero_ps();
  __m256 sum_bb = _mm256_setzero_ps();

  // 2x Unrolling (16 floats per iteration)
  for (; i + 15 < n; i += 16) {
    __m256 va0 = _mm256_loadu_ps(a.data() + i);
    __m256 vb0 = _mm256_loadu_ps(b.data() + i);
    __m256 va1 = _mm256_loadu_ps(a.data() + i + 8);
    __m256 vb1 = _mm256_loadu_ps(b.data() + i + 8);

    sum_dot = _mm256_fmadd_ps(va0, vb0, sum_dot);
    sum_aa = _mm256_fmadd_ps(va0, va0, sum_aa);
    sum_bb = _mm256_fmadd_ps(vb0, vb0, sum_bb);

    sum_dot = _mm256_fmadd_ps(va1, vb1, sum_dot);
    sum_aa = _mm256_fmadd_ps(va1, va1, sum_aa);
    sum_bb = _mm256_fmadd_ps(vb1, vb1, sum_bb);
  }

  // Remainder loop for 8s
  for (; i + 7 < n; i += 8) {
    __m256 va = _mm256_loadu_ps(a.data() + i);
    __m256 vb = _mm256_loadu_ps(b.data() + i);
    sum_dot = _mm256_fmadd_ps(va, vb, sum_dot);
    sum_aa = _mm256_fmadd_ps(va, va, sum_aa);
    sum_bb = _mm256_fmadd_ps(vb, vb, sum_bb);
  }

  float dot = hsum256_ps(sum_dot);
  float norm_a = hsum256_ps(sum_aa);
  float norm_b = hsum256_ps(sum_bb);

  // Scalar cleanup
  for (; i < n; ++i) {
    dot += a[i] * b[i];
    norm_a += a[i] * a[i];
    norm_b += b[i] * b[i];
  }
  return {dot, norm_a, norm_b};
}

// ----------------------------------------------------------------------------
// 3. ARM NEON Implementation (native intrinsics)
//    4x unrolled; vmlaq_f32 straight to NEON without SIMDe translation.
// ----------------------------------------------------------------------------

#if defined(__aarch64__) || defined(__ARM_NEON) || defined(_M_ARM64)
#include <arm_neon.h>

// Horizontal sum of a float32x4_t register
static inline float vhsumq_f32(float32x4_t v) {
  float32x2_t sum = vadd_f32(vget_low_f32(v), vget_high_f32(v));
  sum = vpadd_f32(sum, sum);
  return vget_lane_f32(sum, 0);
}

CosineTerms cosine_terms_neon(std::span<const float> a,
                              std::span<const float> b) {
  size_t n = a.size();
  size_t i = 0;

  float32x4_t sum_dot0 = vdupq_n_f32(0.0f);
  float32x4_t sum_dot1 = vdupq_n_f32(0.0f);
  float32x4_t sum_aa0 = vdupq_n_f32(0.0f);
  float32x4_t sum_aa1 = vdupq_n_f32(0.0f);
  float32x4_t sum_bb0 = vdupq_n_f32(0.0f);
  float32x4_t sum_bb1 = vdupq_n_f32(0.0f);

  const float *pa = a.data();
  const float *pb = b.data();

  // 8 floats per iteration, two independent accumulator chains
  for (; i + 7 < n; i += 8) {
    float32x4_t va0 = vld1q_f32(pa + i);
    float32x4_t vb0 = vld1q_f32(pb + i);
    float32x4_t va1 = vld1q_f32(pa + i + 4);
    float32x4_t vb1 = vld1q_f32(pb + i + 4);

    sum_dot0 = vmlaq_f32(sum_dot0, va0, vb0);
    sum_dot1 = vmlaq_f32(sum_dot1, va1, vb1);
    sum_aa0 = vmlaq_f32(sum_aa0, va0, va0);
    sum_aa1 = vmlaq_f32(sum_aa1, va1, va1);
    sum_bb0 = vmlaq_f32(sum_bb0, vb0, vb0);
    sum_bb1 = vmlaq_f32(sum_bb1, vb1, vb1);
  }

  float dot = vhsumq_f32(vaddq_f32(sum_dot0, sum_dot1));
  float norm_a = vhsumq_f32(vaddq_f32(sum_aa0, sum_aa1));
  float norm_b = vhsumq_f32(vaddq_f32(sum_bb0, sum_bb1));

  for (; i < n; ++i) {
    dot += pa[i] * pb[i];
    norm_a += pa[i] * pa[i];
    norm_b += pb[i] * pb[i];
  }
  return {dot, norm_a, norm_b};
}

#else
// Stub for non-ARM builds, delegates to scalar
CosineTerms cosine_terms_neon(std::span<const float> a,
                              std::span<const float> b) {
  return cosine_terms_scalar(a, b);
}
#endif

// ----------------------------------------------------------------------------
// Dispatch
// ----------------------------------------------------------------------------
CosineTermsFn get_best_cosine_terms_impl() {
#if defined(__aarch64__) || defined(__ARM_NEON) || defined(_M_ARM64)
  return cosine_terms_neon;
#elif defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
  return cosine_terms_avx2;
#else
  return cosine_terms_scalar;
#endif
}

const char *best_kernel_name() noexcept {
#if defined(__aarch64__) || defined(__ARM_NEON) || defined(_M_ARM64)
  return "neon";
#elif defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
  return "avx2-simde";
#else
  return "scalar";
#endif
}

} // namespace embedcache::simd
