#pragma once

/** \file distance.hpp
 *  \brief Scalar distance kernels (L2^2, inner product, cosine) and metric dispatch.
 *
 * Preconditions
 * - a.size() == b.size() > 0
 * - All inputs are finite
 * - For cosine: norms must be strictly positive; the store rejects zero vectors up front
 * Determinism: pure functions, no allocations, no exceptions on hot paths.
 *
 * Every metric is expressed as a distance: smaller is closer.
 *   l2     -> sum((a[i] - b[i])^2)
 *   ip     -> 1 - a.b
 *   cosine -> 1 - a.b / (||a|| * ||b||)
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
#include <immintrin.h>
#endif

namespace cairn::kernels {

/** \brief Distance metric configured per collection. */
enum class Metric : std::uint8_t { l2 = 0, ip = 1, cosine = 2 };

namespace detail {

/** \brief Software prefetch hint for scalar loops. */
inline void scalar_prefetch(const float* ptr) noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
    _mm_prefetch(reinterpret_cast<const char*>(ptr + 16), _MM_HINT_T0);
#else
    (void)ptr;
#endif
}

} // namespace detail

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for better instruction-level parallelism
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    if (i + 16 < n) {
      detail::scalar_prefetch(pa + i);
      detail::scalar_prefetch(pb + i);
    }
    const float d0 = pa[i] - pb[i];
    const float d1 = pa[i+1] - pb[i+1];
    const float d2 = pa[i+2] - pb[i+2];
    const float d3 = pa[i+3] - pb[i+3];
    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }

  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) {
    const float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    if (i + 16 < n) {
      detail::scalar_prefetch(pa + i);
      detail::scalar_prefetch(pb + i);
    }
    s0 += pa[i] * pb[i];
    s1 += pa[i+1] * pb[i+1];
    s2 += pa[i+2] * pb[i+2];
    s3 += pa[i+3] * pb[i+3];
  }

  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Cosine similarity: (a.b) / (||a|| * ||b||). Norms must be > 0. O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float dot = 0.0f, na2 = 0.0f, nb2 = 0.0f;
  for (std::size_t i = 0; i < n; ++i) {
    const float av = pa[i], bv = pb[i];
    dot += av * bv;
    na2 += av * av;
    nb2 += bv * bv;
  }
  const float denom = std::sqrt(na2) * std::sqrt(nb2);
  return dot / denom;
}

/** \brief Cosine distance defined as 1 - cosine_similarity(a,b). O(d). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return 1.0f - cosine_similarity(a, b);
}

/** \brief Squared L2 norm. */
inline float norm_sq(std::span<const float> a) noexcept {
  return inner_product(a, a);
}

/** \brief Distance under `m`; smaller is closer for every metric. */
inline float distance(Metric m, std::span<const float> a, std::span<const float> b) noexcept {
  switch (m) {
    case Metric::l2: return l2_sq(a, b);
    case Metric::ip: return 1.0f - inner_product(a, b);
    case Metric::cosine: return cosine_distance(a, b);
  }
  return l2_sq(a, b);
}

/** \brief Canonical metric name ("l2" | "ip" | "cosine"). */
constexpr auto metric_name(Metric m) noexcept -> std::string_view {
  switch (m) {
    case Metric::l2: return "l2";
    case Metric::ip: return "ip";
    case Metric::cosine: return "cosine";
  }
  return "l2";
}

/** \brief Parse a metric name; nullopt for unknown names. */
constexpr auto parse_metric(std::string_view s) noexcept -> std::optional<Metric> {
  if (s == "l2") return Metric::l2;
  if (s == "ip") return Metric::ip;
  if (s == "cosine") return Metric::cosine;
  return std::nullopt;
}

} // namespace cairn::kernels
