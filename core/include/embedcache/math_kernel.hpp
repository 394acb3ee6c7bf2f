#pragma once

#include "embedcache/simd_impl.hpp"
#include <cmath>
#include <optional>
#include <span>

namespace embedcache::math {

/**
 * @brief Dot product and squared norms of two equal-length vectors.
 * Dispatches once to the best SIMD kernel for this CPU.
 */
inline simd::CosineTerms cosine_terms(std::span<const float> a,
                                      std::span<const float> b) {
  if (a.size() != b.size()) [[unlikely]] {
    return {0.0f, 0.0f, 0.0f};
  }

  // Thread-safe one-time initialization of best kernel
  static const auto kernel = simd::get_best_cosine_terms_impl();
  return kernel(a, b);
}

/**
 * @brief Cosine similarity (A . B) / (|A| * |B|), or nullopt when either
 * vector has zero norm and the similarity is undefined.
 *
 * The final division runs in double so the score does not lose precision in
 * the product of the two norms.
 */
inline std::optional<float> cosine_similarity(std::span<const float> a,
                                              std::span<const float> b) {
  if (a.size() != b.size()) [[unlikely]]
    return std::nullopt;

  const auto t = cosine_terms(a, b);
  if (!(t.norm_a_sq > 0.0f) || !(t.norm_b_sq > 0.0f)) [[unlikely]]
    return std::nullopt;

  const double denom = std::sqrt(static_cast<double>(t.norm_a_sq)) *
                       std::sqrt(static_cast<double>(t.norm_b_sq));
  return static_cast<float>(static_cast<double>(t.dot) / denom);
}

/// Squared L2 norm.
inline float norm_sq(std::span<const float> v) {
  return cosine_terms(v, v).norm_a_sq;
}

} // namespace embedcache::math
