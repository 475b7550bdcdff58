#include <catch2/catch_all.hpp>
#include <cairn/index/vector_store.hpp>
#include <tests/support/temp_dir.hpp>

#include <algorithm>
#include <filesystem>
#include <random>

using namespace cairn;
using namespace cairn::index;
namespace fs = std::filesystem;

namespace {

VectorStoreOptions options(const fs::path& dir, std::size_t dim, IndexKind kind = IndexKind::flat) {
  VectorStoreOptions o;
  o.dir = dir;
  o.dim = dim;
  o.kind = kind;
  o.sync_writes = false;
  o.hnsw.M = 8;
  o.hnsw.efConstruction = 64;
  return o;
}

VectorOp upsert(std::string id, std::uint64_t seq, std::vector<float> v) {
  return VectorOp{VectorOp::Kind::upsert, std::move(id), seq, std::move(v)};
}

VectorOp tombstone(std::string id, std::uint64_t seq) {
  return VectorOp{VectorOp::Kind::remove, std::move(id), seq, {}};
}

void commit(VectorStore& s, const std::vector<VectorOp>& ops) {
  auto mark = s.write(ops);
  REQUIRE(mark.has_value());
  REQUIRE(s.apply(ops).has_value());
}

std::vector<std::string> ids_of(const VectorStore& s, const std::vector<ScoredSlot>& hits) {
  std::vector<std::string> out;
  for (const auto& h : hits) out.push_back(s.id_at(h.slot));
  return out;
}

} // namespace

TEST_CASE("flat store answers exact queries with slot-order ties", "[index][store]") {
  test_support::TempDir dir("cairn_store");
  auto store = VectorStore::open(options(dir.path(), 2), 0);
  REQUIRE(store.has_value());
  auto& s = **store;
  commit(s, {upsert("a", 1, {1, 0}), upsert("b", 2, {0, 1}), upsert("c", 3, {-1, 0}), upsert("d", 4, {0, -1})});
  REQUIRE(s.size() == 4);
  REQUIRE(s.applied_seq() == 4);

  auto hits = s.query(std::vector<float>{0, 0}, 3);
  REQUIRE(hits.has_value());
  REQUIRE(ids_of(s, *hits) == std::vector<std::string>{"a", "b", "c"});

  auto near_a = s.query(std::vector<float>{0.9f, 0.1f}, 10);
  REQUIRE(near_a->size() == 4);
  REQUIRE(s.id_at(near_a->front().slot) == "a");
  REQUIRE(std::is_sorted(near_a->begin(), near_a->end(),
                         [](const ScoredSlot& x, const ScoredSlot& y) { return x.distance < y.distance; }));

  REQUIRE(s.query(std::vector<float>{1, 2, 3}, 1).error().code == core::error_code::invalid_argument);
  REQUIRE(s.query(std::vector<float>{0, 0}, 0)->empty());
}

TEST_CASE("replacing and removing ids tombstones their slots", "[index][store]") {
  test_support::TempDir dir("cairn_store");
  auto store = VectorStore::open(options(dir.path(), 2), 0);
  REQUIRE(store.has_value());
  auto& s = **store;
  commit(s, {upsert("a", 1, {1, 0}), upsert("b", 2, {0, 1})});
  commit(s, {upsert("a", 3, {5, 5}), tombstone("b", 4), tombstone("never", 5)});
  REQUIRE(s.size() == 1);
  REQUIRE_FALSE(s.contains("b"));
  REQUIRE(s.live_ids() == std::vector<std::string>{"a"});
  const auto v = s.vector_at(*s.slot_of("a"));
  REQUIRE(std::vector<float>(v.begin(), v.end()) == std::vector<float>{5, 5});
  auto st = s.stats();
  REQUIRE(st.slots == 3);
  REQUIRE(st.tombstones == 2);

  auto hits = s.query(std::vector<float>{0, 1}, 5);
  REQUIRE(ids_of(s, *hits) == std::vector<std::string>{"a"});
}

TEST_CASE("reopen replays the log up to the committed sequence", "[index][store]") {
  test_support::TempDir dir("cairn_store");
  {
    auto store = VectorStore::open(options(dir.path(), 2), 0);
    REQUIRE(store.has_value());
    commit(**store, {upsert("a", 1, {1, 0}), upsert("b", 2, {0, 1})});
    commit(**store, {tombstone("a", 3)});
    // written but never committed by the catalog
    REQUIRE((*store)->write(std::vector<VectorOp>{upsert("c", 4, {2, 2})}).has_value());
  }
  const auto log_path = dir.path() / VectorStore::kLogFile;
  const auto before = fs::file_size(log_path);

  auto store = VectorStore::open(options(dir.path(), 2), 3);
  REQUIRE(store.has_value());
  auto& s = **store;
  REQUIRE(s.live_ids() == std::vector<std::string>{"b"});
  REQUIRE(s.applied_seq() == 3);
  REQUIRE(s.replay_stats().frames_replayed == 3);
  REQUIRE(s.replay_stats().frames_discarded == 1);
  REQUIRE(s.replay_stats().bytes_truncated > 0);
  REQUIRE(fs::file_size(log_path) == before - s.replay_stats().bytes_truncated);
}

TEST_CASE("a log shorter than the committed sequence", "[index][store]") {
  test_support::TempDir dir("cairn_store");
  {
    auto store = VectorStore::open(options(dir.path(), 2), 0);
    REQUIRE(store.has_value());
    commit(**store, {upsert("a", 1, {1, 0})});
  }
  SECTION("fails a strict open") {
    auto store = VectorStore::open(options(dir.path(), 2), 2);
    REQUIRE_FALSE(store.has_value());
    REQUIRE(store.error().code == core::error_code::data_integrity);
  }
  SECTION("is flagged by a lenient open") {
    auto o = options(dir.path(), 2);
    o.strict = false;
    auto store = VectorStore::open(o, 2);
    REQUIRE(store.has_value());
    REQUIRE((*store)->replay_stats().sequence_mismatch);
    REQUIRE((*store)->size() == 1);
  }
}

TEST_CASE("torn log tail is cut on reopen", "[index][store]") {
  test_support::TempDir dir("cairn_store");
  {
    auto store = VectorStore::open(options(dir.path(), 2), 0);
    REQUIRE(store.has_value());
    commit(**store, {upsert("a", 1, {1, 0})});
  }
  const auto log_path = dir.path() / VectorStore::kLogFile;
  const auto good = fs::file_size(log_path);
  test_support::append_bytes(log_path, std::vector<std::uint8_t>{0x43, 0x52, 0x4E, 0x4C, 0x01});

  auto store = VectorStore::open(options(dir.path(), 2), 1);
  REQUIRE(store.has_value());
  REQUIRE((*store)->replay_stats().bytes_truncated == 5);
  REQUIRE(fs::file_size(log_path) == good);
}

TEST_CASE("rollback cuts an uncommitted write", "[index][store]") {
  test_support::TempDir dir("cairn_store");
  auto store = VectorStore::open(options(dir.path(), 2), 0);
  REQUIRE(store.has_value());
  auto& s = **store;
  commit(s, {upsert("a", 1, {1, 0})});
  const auto size = s.stats().log_bytes;
  std::vector<VectorOp> ops{upsert("b", 2, {0, 1})};
  auto mark = s.write(ops);
  REQUIRE(mark.has_value());
  REQUIRE(*mark == size);
  REQUIRE(s.rollback(*mark).has_value());
  REQUIRE(s.stats().log_bytes == size);
  REQUIRE_FALSE(s.contains("b"));
}

TEST_CASE("a rollback that cannot cut the log stops further writes", "[index][store]") {
  test_support::TempDir dir("cairn_store");
  auto store = VectorStore::open(options(dir.path(), 2), 0);
  REQUIRE(store.has_value());
  auto& s = **store;
  commit(s, {upsert("a", 1, {1, 0})});
  REQUIRE(s.writable());

  std::vector<VectorOp> ops{upsert("b", 2, {0, 1})};
  auto mark = s.write(ops);
  REQUIRE(mark.has_value());
  // A directory in place of the log makes the truncate fail.
  const auto log_path = dir / VectorStore::kLogFile;
  fs::remove(log_path);
  fs::create_directory(log_path);

  REQUIRE_FALSE(s.rollback(*mark).has_value());
  REQUIRE_FALSE(s.writable());
  std::vector<VectorOp> more{upsert("c", 3, {1, 1})};
  REQUIRE(s.write(more).error().code == core::error_code::io_failed);
  REQUIRE(s.contains("a"));
  REQUIRE_FALSE(s.contains("c"));
}

TEST_CASE("compaction rewrites the segment and keeps results", "[index][store]") {
  test_support::TempDir dir("cairn_store");
  auto o = options(dir.path(), 3);
  o.compaction_min_tombstones = 4;
  o.compaction_ratio = 0.5;
  std::vector<std::string> expected_live;
  {
    auto store = VectorStore::open(o, 0);
    REQUIRE(store.has_value());
    auto& s = **store;
    std::vector<VectorOp> ops;
    for (std::uint64_t i = 0; i < 10; ++i) {
      ops.push_back(upsert("r" + std::to_string(i), i + 1, {float(i), float(i) * 0.5f, 1.0f}));
    }
    commit(s, ops);
    commit(s, {tombstone("r1", 11), tombstone("r3", 12), tombstone("r5", 13)});
    REQUIRE_FALSE(s.needs_compaction());
    commit(s, {tombstone("r7", 14), tombstone("r9", 15)});
    REQUIRE(s.needs_compaction());

    auto before = s.query(std::vector<float>{4, 2, 1}, 3);
    REQUIRE(before.has_value());
    auto before_ids = ids_of(s, *before);

    REQUIRE(s.compact().has_value());
    auto st = s.stats();
    REQUIRE(st.slots == 5);
    REQUIRE(st.tombstones == 0);
    REQUIRE(st.log_bytes == 0);
    REQUIRE(st.compactions == 1);
    REQUIRE(ids_of(s, *s.query(std::vector<float>{4, 2, 1}, 3)) == before_ids);
    commit(s, {upsert("r10", 16, {10, 5, 1})});
    expected_live = s.live_ids();
  }
  REQUIRE(fs::exists(dir.path() / VectorStore::kSegmentFile));

  auto store = VectorStore::open(o, 16);
  REQUIRE(store.has_value());
  REQUIRE((*store)->replay_stats().segment_cutoff == 15);
  REQUIRE((*store)->replay_stats().segment_records == 5);
  REQUIRE((*store)->live_ids() == expected_live);
}

TEST_CASE("hnsw store returns exactly min(k, eligible) hits", "[index][store][hnsw]") {
  test_support::TempDir dir("cairn_store");
  const std::size_t dim = 8, n = 200;
  std::mt19937 rng(11);
  std::normal_distribution<float> g;
  std::vector<VectorOp> ops;
  for (std::uint64_t i = 0; i < n; ++i) {
    std::vector<float> v(dim);
    for (auto& x : v) x = g(rng);
    ops.push_back(upsert("v" + std::to_string(i), i + 1, std::move(v)));
  }
  std::vector<float> q(dim, 0.1f);
  std::vector<std::string> flat_top;
  {
    auto store = VectorStore::open(options(dir.path(), dim, IndexKind::hnsw), 0);
    REQUIRE(store.has_value());
    auto& s = **store;
    commit(s, ops);

    auto hits = s.query(q, 10);
    REQUIRE(hits->size() == 10);

    roaring::Roaring allowed;
    for (std::uint32_t slot : {3u, 17u, 42u}) allowed.add(slot);
    auto filtered = s.query(q, 10, &allowed);
    REQUIRE(filtered.has_value());
    REQUIRE(filtered->size() == 3);
    for (const auto& h : *filtered) REQUIRE(allowed.contains(h.slot));

    commit(s, {tombstone("v17", n + 1)});
    filtered = s.query(q, 10, &allowed);
    REQUIRE(filtered->size() == 2);
    REQUIRE(s.checkpoint().has_value());
    REQUIRE(fs::exists(dir.path() / VectorStore::kGraphFile));
  }
  auto store = VectorStore::open(options(dir.path(), dim, IndexKind::hnsw), n + 1);
  REQUIRE(store.has_value());
  REQUIRE((*store)->replay_stats().graph_loaded);
  REQUIRE((*store)->size() == n - 1);
  REQUIRE((*store)->query(q, 500)->size() == n - 1);
}

TEST_CASE("read-only store never writes", "[index][store]") {
  test_support::TempDir dir("cairn_store");
  {
    auto store = VectorStore::open(options(dir.path(), 2), 0);
    REQUIRE(store.has_value());
    commit(**store, {upsert("a", 1, {1, 0})});
    REQUIRE((*store)->write(std::vector<VectorOp>{upsert("b", 2, {0, 1})}).has_value());
  }
  const auto log_path = dir.path() / VectorStore::kLogFile;
  const auto before = fs::file_size(log_path);
  auto o = options(dir.path(), 2);
  o.read_only = true;
  auto store = VectorStore::open(o, 1);
  REQUIRE(store.has_value());
  REQUIRE((*store)->replay_stats().frames_discarded == 1);
  REQUIRE(fs::file_size(log_path) == before);
  REQUIRE((*store)->write(std::vector<VectorOp>{tombstone("a", 2)}).error().code == core::error_code::read_only);
  REQUIRE((*store)->compact().error().code == core::error_code::read_only);
}
