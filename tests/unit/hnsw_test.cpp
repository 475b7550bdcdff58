#include <catch2/catch_all.hpp>
#include <cairn/index/hnsw.hpp>
#include <cairn/kernels/distance.hpp>
#include <cairn/wal/frame.hpp>
#include <tests/support/temp_dir.hpp>

#include <algorithm>
#include <random>
#include <set>
#include <vector>

using namespace cairn;
using namespace cairn::index;

namespace {

struct Dataset {
  std::size_t dim{};
  std::vector<float> data;
  const float* row(std::uint32_t i) const { return data.data() + std::size_t{i} * dim; }
  VectorFetch fetch() const { return [this](std::uint32_t l) { return row(l); }; }
};

Dataset make_dataset(std::size_t n, std::size_t dim, unsigned seed) {
  Dataset ds{dim, std::vector<float>(n * dim)};
  std::mt19937 rng(seed);
  std::normal_distribution<float> g(0.0f, 1.0f);
  for (auto& x : ds.data) x = g(rng);
  return ds;
}

std::vector<std::uint32_t> brute_force(const Dataset& ds, std::size_t n, const float* q, std::size_t k) {
  std::vector<std::pair<float, std::uint32_t>> all;
  for (std::uint32_t i = 0; i < n; ++i) {
    all.emplace_back(kernels::l2_sq({q, ds.dim}, {ds.row(i), ds.dim}), i);
  }
  std::sort(all.begin(), all.end());
  std::vector<std::uint32_t> out;
  for (std::size_t i = 0; i < k; ++i) out.push_back(all[i].second);
  return out;
}

} // namespace

TEST_CASE("HNSW init validates parameters", "[hnsw]") {
  Dataset ds = make_dataset(1, 4, 1);
  HnswIndex index;
  HnswBuildParams p;
  REQUIRE(index.init(0, kernels::Metric::l2, p, ds.fetch()).error().code == core::error_code::invalid_argument);
  p.M = 1;
  REQUIRE_FALSE(index.init(4, kernels::Metric::l2, p, ds.fetch()).has_value());
  p.M = 16;
  p.efConstruction = 8;
  REQUIRE_FALSE(index.init(4, kernels::Metric::l2, p, ds.fetch()).has_value());
  p.efConstruction = 64;
  REQUIRE_FALSE(index.init(4, kernels::Metric::l2, p, VectorFetch{}).has_value());
  REQUIRE(index.init(4, kernels::Metric::l2, p, ds.fetch()).has_value());
  REQUIRE(index.is_initialized());
  REQUIRE(index.size() == 0);
}

TEST_CASE("HNSW labels must be added in order", "[hnsw]") {
  Dataset ds = make_dataset(4, 8, 2);
  HnswIndex index;
  REQUIRE(index.init(8, kernels::Metric::l2, HnswBuildParams{}, ds.fetch()).has_value());
  REQUIRE(index.add(0).has_value());
  REQUIRE_FALSE(index.add(2).has_value());
  REQUIRE(index.add(1).has_value());
  REQUIRE(index.size() == 2);
}

TEST_CASE("HNSW recall on a random dataset", "[hnsw]") {
  const std::size_t n = 1000, dim = 16, k = 10;
  Dataset ds = make_dataset(n, dim, 3);
  HnswIndex index;
  HnswBuildParams p;
  p.M = 16;
  p.efConstruction = 200;
  REQUIRE(index.init(dim, kernels::Metric::l2, p, ds.fetch()).has_value());
  for (std::uint32_t i = 0; i < n; ++i) REQUIRE(index.add(i).has_value());
  REQUIRE(index.reachable_count_base_layer() == n);

  Dataset queries = make_dataset(50, dim, 99);
  std::size_t hits = 0;
  HnswSearchParams sp;
  sp.k = k;
  sp.efSearch = 128;
  for (std::uint32_t qi = 0; qi < 50; ++qi) {
    auto res = index.search(queries.row(qi), sp);
    REQUIRE(res.has_value());
    REQUIRE(res->size() == k);
    REQUIRE(std::is_sorted(res->begin(), res->end(),
                           [](const auto& a, const auto& b) { return a.second < b.second; }));
    auto truth = brute_force(ds, n, queries.row(qi), k);
    std::set<std::uint32_t> t(truth.begin(), truth.end());
    for (const auto& [label, d] : *res) hits += t.count(label);
  }
  const double recall = static_cast<double>(hits) / (50.0 * k);
  REQUIRE(recall >= 0.9);
}

TEST_CASE("HNSW never returns deleted or rejected labels", "[hnsw]") {
  const std::size_t n = 300, dim = 8;
  Dataset ds = make_dataset(n, dim, 4);
  HnswIndex index;
  REQUIRE(index.init(dim, kernels::Metric::l2, HnswBuildParams{8, 64, 7, true}, ds.fetch()).has_value());
  for (std::uint32_t i = 0; i < n; ++i) REQUIRE(index.add(i).has_value());
  for (std::uint32_t i = 0; i < n; i += 2) REQUIRE(index.mark_deleted(i).has_value());
  REQUIRE(index.get_stats().n_deleted == n / 2);
  REQUIRE(index.mark_deleted(static_cast<std::uint32_t>(n)).error().code == core::error_code::not_found);

  HnswSearchParams sp;
  sp.k = 20;
  sp.efSearch = 64;
  sp.accept = [](std::uint32_t l) { return l % 3 != 0; };
  auto res = index.search(ds.row(1), sp);
  REQUIRE(res.has_value());
  REQUIRE_FALSE(res->empty());
  for (const auto& [label, d] : *res) {
    REQUIRE(label % 2 == 1);
    REQUIRE(label % 3 != 0);
    REQUIRE_FALSE(index.is_deleted(label));
  }
}

TEST_CASE("HNSW save and load keep search results", "[hnsw]") {
  test_support::TempDir dir("cairn_hnsw");
  const std::size_t n = 200, dim = 12;
  Dataset ds = make_dataset(n, dim, 5);
  HnswIndex index;
  REQUIRE(index.init(dim, kernels::Metric::cosine, HnswBuildParams{12, 80, 11, true}, ds.fetch()).has_value());
  for (std::uint32_t i = 0; i < n; ++i) REQUIRE(index.add(i).has_value());
  REQUIRE(index.mark_deleted(3).has_value());
  REQUIRE(index.save(dir / "g.bin").has_value());

  auto loaded = HnswIndex::load(dir / "g.bin", dim, kernels::Metric::cosine, ds.fetch());
  REQUIRE(loaded.has_value());
  REQUIRE(loaded->size() == n);
  REQUIRE(loaded->is_deleted(3));
  REQUIRE(loaded->get_build_params().M == 12);

  HnswSearchParams sp;
  sp.k = 5;
  for (std::uint32_t q = 0; q < 10; ++q) {
    auto a = index.search(ds.row(q), sp);
    auto b = loaded->search(ds.row(q), sp);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(*a == *b);
  }

  SECTION("wrong dimension is rejected") {
    auto bad = HnswIndex::load(dir / "g.bin", dim + 1, kernels::Metric::cosine, ds.fetch());
    REQUIRE(bad.error().code == core::error_code::invalid_argument);
  }
  SECTION("file ends with a little-endian crc32c of its body") {
    const auto bytes = test_support::slurp(dir / "g.bin");
    REQUIRE(bytes.size() > 4);
    const auto body = std::span<const std::uint8_t>(bytes).first(bytes.size() - 4);
    const std::uint8_t* tail = bytes.data() + bytes.size() - 4;
    const std::uint32_t stored = std::uint32_t{tail[0]} | (std::uint32_t{tail[1]} << 8) |
                                 (std::uint32_t{tail[2]} << 16) | (std::uint32_t{tail[3]} << 24);
    REQUIRE(stored == wal::crc32c(body));
  }
  SECTION("damaged file is data_integrity") {
    test_support::clobber(dir / "g.bin", 40, 4, 0xFF);
    auto bad = HnswIndex::load(dir / "g.bin", dim, kernels::Metric::cosine, ds.fetch());
    REQUIRE(bad.error().code == core::error_code::data_integrity);
  }
}

TEST_CASE("robust_prune keeps diverse neighbours first", "[hnsw]") {
  // 1-D points: base at 0, candidates at 1, 1.1 and -1
  const std::vector<float> pos{0.0f, 1.0f, 1.1f, -1.0f};
  auto dist = [&](std::uint32_t a, std::uint32_t b) { return (pos[a] - pos[b]) * (pos[a] - pos[b]); };
  std::vector<std::pair<float, std::uint32_t>> cands{{dist(0, 2), 2}, {dist(0, 1), 1}, {dist(0, 3), 3}};

  auto strict = robust_prune(cands, 2, dist, false);
  REQUIRE(strict == std::vector<std::uint32_t>{1, 3});

  auto filled = robust_prune(cands, 3, dist, true);
  REQUIRE(filled == std::vector<std::uint32_t>{1, 3, 2});
}
