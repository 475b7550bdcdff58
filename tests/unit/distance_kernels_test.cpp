#include <catch2/catch_all.hpp>
#include <cairn/kernels/distance.hpp>

#include <random>
#include <vector>

using namespace cairn::kernels;
using Catch::Matchers::WithinAbs;

TEST_CASE("l2 is squared euclidean", "[kernels][distance]") {
  std::vector<float> a{0.0f, 0.0f}, b{3.0f, 4.0f};
  REQUIRE_THAT(distance(Metric::l2, a, b), WithinAbs(25.0, 1e-5));
  REQUIRE_THAT(distance(Metric::l2, b, b), WithinAbs(0.0, 1e-6));
}

TEST_CASE("ip distance is one minus dot product", "[kernels][distance]") {
  std::vector<float> a{1.0f, 2.0f, 3.0f}, b{0.5f, -1.0f, 2.0f};
  REQUIRE_THAT(distance(Metric::ip, a, b), WithinAbs(1.0 - 4.5, 1e-5));
}

TEST_CASE("cosine distance ignores magnitude", "[kernels][distance]") {
  std::vector<float> a{1.0f, 0.0f}, b{10.0f, 0.0f}, c{0.0f, 2.0f}, d{-3.0f, 0.0f};
  REQUIRE_THAT(distance(Metric::cosine, a, b), WithinAbs(0.0, 1e-6));
  REQUIRE_THAT(distance(Metric::cosine, a, c), WithinAbs(1.0, 1e-6));
  REQUIRE_THAT(distance(Metric::cosine, a, d), WithinAbs(2.0, 1e-6));
}

TEST_CASE("kernels agree with a scalar reference on odd dimensions", "[kernels][distance]") {
  std::mt19937 rng(7);
  std::uniform_real_distribution<float> u(-1.0f, 1.0f);
  for (std::size_t dim : {1u, 3u, 7u, 17u, 33u, 128u}) {
    std::vector<float> a(dim), b(dim);
    for (auto& x : a) x = u(rng);
    for (auto& x : b) x = u(rng);
    double l2 = 0.0, dot = 0.0;
    for (std::size_t i = 0; i < dim; ++i) {
      l2 += double(a[i] - b[i]) * double(a[i] - b[i]);
      dot += double(a[i]) * double(b[i]);
    }
    REQUIRE_THAT(l2_sq(a, b), WithinAbs(l2, 1e-4));
    REQUIRE_THAT(inner_product(a, b), WithinAbs(dot, 1e-4));
  }
}

TEST_CASE("metric names parse back", "[kernels]") {
  for (auto m : {Metric::l2, Metric::ip, Metric::cosine}) {
    auto p = parse_metric(metric_name(m));
    REQUIRE(p.has_value());
    REQUIRE(*p == m);
  }
  REQUIRE_FALSE(parse_metric("manhattan").has_value());
}
