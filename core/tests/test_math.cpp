#include "embedcache/core.hpp"
#include "embedcache/math_kernel.hpp"
#include "embedcache/simd_impl.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

namespace {
// Use a double-precision implementation for ground truth
double ground_truth_cosine(std::span<const float> a, std::span<const float> b) {
  double dot = 0.0, na = 0.0, nb = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

std::vector<float> random_vector(size_t dim, unsigned seed) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<float> v(dim);
  for (auto &val : v)
    val = dist(rng);
  return v;
}
} // namespace

TEST(MathKernel, CosineMatchesGroundTruth) {
  // Odd length exercises the SIMD tail.
  auto a = random_vector(1537, 42);
  auto b = random_vector(1537, 43);

  auto score = embedcache::math::cosine_similarity(a, b);
  ASSERT_TRUE(score.has_value());
  EXPECT_TRUE(std::isfinite(*score));
  EXPECT_NEAR(*score, ground_truth_cosine(a, b), 1e-5);

  // Symmetry under the same kernel.
  EXPECT_FLOAT_EQ(*score, *embedcache::math::cosine_similarity(b, a));
}

TEST(MathKernel, KernelsAgreeWithScalar) {
  auto a = random_vector(768, 7);
  auto b = random_vector(768, 8);

  auto scalar = embedcache::simd::cosine_terms_scalar(a, b);
  auto best = embedcache::simd::get_best_cosine_terms_impl()(a, b);
  EXPECT_NEAR(best.dot, scalar.dot, 1e-3f);
  EXPECT_NEAR(best.norm_a_sq, scalar.norm_a_sq, 1e-3f);
  EXPECT_NEAR(best.norm_b_sq, scalar.norm_b_sq, 1e-3f);
  EXPECT_NE(std::string(embedcache::simd::best_kernel_name()), "");
}

TEST(MathKernel, CosineSimilarityIdentity) {
  std::vector<float> a(768, 1.0f);
  EXPECT_NEAR(*embedcache::math::cosine_similarity(a, a), 1.0f, 1e-5f);
}

TEST(MathKernel, CosineSimilarityOrthogonal) {
  std::vector<float> a = {1, 0, 0, 0};
  std::vector<float> b = {0, 1, 0, 0};
  EXPECT_NEAR(*embedcache::math::cosine_similarity(a, b), 0.0f, 1e-6f);
}

TEST(MathKernel, CosineSimilarityOpposite) {
  std::vector<float> a = {1, 2, 3};
  std::vector<float> b = {-1, -2, -3};
  EXPECT_NEAR(*embedcache::math::cosine_similarity(a, b), -1.0f, 1e-6f);
}

TEST(MathKernel, ScaleInvariant) {
  std::vector<float> a = {0.95f, 0.1f, 0.05f};
  std::vector<float> b = {1900.0f, 200.0f, 100.0f};
  EXPECT_NEAR(*embedcache::math::cosine_similarity(a, b), 1.0f, 1e-6f);
}

TEST(MathKernel, ZeroNormIsUndefined) {
  std::vector<float> zero(16, 0.0f);
  std::vector<float> one(16, 1.0f);
  EXPECT_FALSE(embedcache::math::cosine_similarity(zero, one).has_value());
  EXPECT_FALSE(embedcache::math::cosine_similarity(one, zero).has_value());
}

TEST(MathKernel, LengthMismatchIsUndefined) {
  std::vector<float> a(4, 1.0f);
  std::vector<float> b(5, 1.0f);
  EXPECT_FALSE(embedcache::math::cosine_similarity(a, b).has_value());
}

TEST(MathKernel, NormSquared) {
  std::vector<float> v = {3, 4};
  EXPECT_FLOAT_EQ(embedcache::math::norm_sq(v), 25.0f);
}

TEST(BuildInfoTest, DescribesToolchainAndKernel) {
  auto info = embedcache::core::get_build_info();
  EXPECT_EQ(embedcache::core::version(), "1.0.0");
  EXPECT_EQ(info.simd_kernel, embedcache::simd::best_kernel_name());
  EXPECT_EQ(info.standard.rfind("C++", 0), 0u);
  EXPECT_GT(info.standard.size(), 3u);
#if defined(__clang__)
  EXPECT_EQ(info.compiler.rfind("Clang ", 0), 0u);
#elif defined(__GNUC__)
  EXPECT_EQ(info.compiler,
            "GCC " + std::to_string(__GNUC__) + "." +
                std::to_string(__GNUC_MINOR__) + "." +
                std::to_string(__GNUC_PATCHLEVEL__));
#endif
}
