// Header for SIMD implementation
#pragma once
#include <cmath>
#include <cstdint>
#include <span>

namespace embedcache::simd {

/// Dot product and both squared norms, accumulated in one pass.
struct CosineTerms {
  float dot;
  float norm_a_sq;
  float norm_b_sq;
};

// Function pointer type for the fused dot/norm kernel
using CosineTermsFn = CosineTerms (*)(std::span<const float>,
                                      std::span<const float>);

// --- Implementations ---

// 1. Scalar (Portable)
CosineTerms cosine_terms_scalar(std::span<const float> a,
                                std::span<const float> b);

// 2. AVX2 (via SIMDe; emulated when the target lacks AVX2)
CosineTerms cosine_terms_avx2(std::span<const float> a,
                              std::span<const float> b);

// 3. ARM NEON (ARM64 / Apple Silicon)
//    Explicit intrinsics, two accumulator chains of 4 lanes each.
CosineTerms cosine_terms_neon(std::span<const float> a,
                              std::span<const float> b);

// --- Dispatch ---
// Returns the best implementation for the current CPU.
// ARM64: NEON (native)
// x86:   AVX2 (via SIMDe) → Scalar
CosineTermsFn get_best_cosine_terms_impl();

/// Name of the kernel get_best_cosine_terms_impl() selects.
const char *best_kernel_name() noexcept;

} // namespace embedcache::simd
