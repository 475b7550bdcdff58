#include <catch2/catch_all.hpp>
#include <cairn/catalog/catalog.hpp>
#include <catalog/migrations.hpp>
#include <tests/support/temp_dir.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include <sqlite3.h>

using namespace cairn;
using namespace cairn::catalog;

namespace {

CollectionSchema schema_2d() {
  CollectionSchema s;
  s.dimension = 2;
  s.metric = Metric::cosine;
  return s;
}

RecordMetadata record(std::string id, std::uint64_t seq, std::optional<std::string> doc = std::nullopt,
                      metadata::Metadata md = {}) {
  return RecordMetadata{std::move(id), seq, std::move(doc), std::move(md)};
}

void raw_exec(const std::filesystem::path& path, const std::string& sql) {
  sqlite3* db = nullptr;
  REQUIRE(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK);
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  std::string msg = err ? err : "";
  sqlite3_free(err);
  sqlite3_close(db);
  INFO(msg);
  REQUIRE(rc == SQLITE_OK);
}

} // namespace

TEST_CASE("catalog creates the current schema", "[catalog]") {
  test_support::TempDir dir("cairn_catalog");
  auto cat = Catalog::open(dir / "catalog.sqlite3");
  REQUIRE(cat.has_value());
  REQUIRE((*cat)->opened_version() == 0);
  REQUIRE((*cat)->schema_version().value() == kSchemaVersion);
  REQUIRE((*cat)->integrity_check().has_value());
}

TEST_CASE("an empty catalog file gets a schema only when allowed", "[catalog]") {
  test_support::TempDir dir("cairn_catalog");
  const auto path = dir / "catalog.sqlite3";
  { std::ofstream touch(path, std::ios::binary); }

  SECTION("refused") {
    auto cat = Catalog::open(path, CatalogOptions{.initialize_schema = false});
    REQUIRE(cat.error().code == core::error_code::data_integrity);
  }
  SECTION("read-only") {
    auto cat = Catalog::open(path, CatalogOptions{.create_if_missing = false, .read_only = true});
    REQUIRE(cat.error().code == core::error_code::data_integrity);
  }
  SECTION("allowed") {
    auto cat = Catalog::open(path);
    REQUIRE(cat.has_value());
    REQUIRE((*cat)->schema_version().value() == kSchemaVersion);
  }
}

TEST_CASE("catalog collections", "[catalog]") {
  test_support::TempDir dir("cairn_catalog");
  auto opened = Catalog::open(dir / "catalog.sqlite3");
  REQUIRE(opened.has_value());
  auto& cat = **opened;

  CollectionSchema s = schema_2d();
  s.index = IndexKind::hnsw;
  s.hnsw.M = 12;
  s.hnsw.ef_construction = 99;
  s.metadata.fields["lang"] = metadata::FieldSpec{metadata::ValueType::string, true};
  s.metadata.strict = true;
  auto a = cat.create_collection("docs", s);
  REQUIRE(a.has_value());
  auto b = cat.create_collection("notes", schema_2d());
  REQUIRE(b.has_value());
  REQUIRE(b->id > a->id);

  auto dup = cat.create_collection("docs", schema_2d());
  REQUIRE(dup.error().code == core::error_code::already_exists);

  auto got = cat.get_collection("docs");
  REQUIRE(got.has_value());
  REQUIRE(got->id == a->id);
  REQUIRE(got->schema.dimension == 2);
  REQUIRE(got->schema.metric == Metric::cosine);
  REQUIRE(got->schema.index == IndexKind::hnsw);
  REQUIRE(got->schema.hnsw.M == 12);
  REQUIRE(got->schema.hnsw.ef_construction == 99);
  REQUIRE(got->schema.metadata.strict);
  REQUIRE(got->schema.metadata.fields.at("lang").required);
  REQUIRE(cat.get_collection(b->id)->name == "notes");
  REQUIRE(cat.get_collection("nope").error().code == core::error_code::not_found);

  REQUIRE(cat.set_committed_seq(a->id, 17).has_value());
  REQUIRE(cat.get_collection("docs")->committed_seq == 17);
  REQUIRE(cat.set_committed_seq(9999, 1).error().code == core::error_code::not_found);

  auto deleted = cat.delete_collection("docs");
  REQUIRE(deleted.has_value());
  REQUIRE(deleted->id == a->id);
  auto all = cat.list_collections();
  REQUIRE(all->size() == 1);
  REQUIRE(all->front().name == "notes");

  // ids are never reused
  auto c = cat.create_collection("docs", schema_2d());
  REQUIRE(c->id > b->id);
}

TEST_CASE("catalog records and typed metadata", "[catalog]") {
  test_support::TempDir dir("cairn_catalog");
  auto opened = Catalog::open(dir / "catalog.sqlite3");
  REQUIRE(opened.has_value());
  auto& cat = **opened;
  const auto cid = cat.create_collection("docs", schema_2d())->id;

  metadata::Metadata md{{"title", std::string("hello")}, {"score", 0.25}, {"year", std::int64_t{1999}},
                        {"draft", true}};
  {
    auto tx = cat.begin();
    REQUIRE(tx.has_value());
    REQUIRE(cat.put_record(cid, record("b", 1, "second doc", md)).has_value());
    REQUIRE(cat.put_record(cid, record("a", 2)).has_value());
    REQUIRE(tx->commit().has_value());
  }

  auto b = cat.get_record(cid, "b");
  REQUIRE(b.has_value());
  REQUIRE(b->has_value());
  REQUIRE((*b)->document == std::optional<std::string>("second doc"));
  REQUIRE((*b)->metadata == md);
  REQUIRE((*b)->seq == 1);
  REQUIRE_FALSE(cat.get_record(cid, "zzz")->has_value());

  auto listed = cat.list_records(cid);
  REQUIRE(listed->size() == 2);
  REQUIRE((*listed)[0].id == "b");
  REQUIRE((*listed)[1].id == "a");
  REQUIRE((*listed)[0].metadata == md);
  REQUIRE(cat.list_records(cid, 1, 1)->front().id == "a");
  REQUIRE(cat.list_record_ids(cid).value() == std::vector<std::string>{"b", "a"});
  REQUIRE(cat.count_records(cid).value() == 2);

  {
    auto tx = cat.begin();
    REQUIRE(tx.has_value());
    REQUIRE(cat.put_record(cid, record("b", 3, std::nullopt, {{"only", false}})).has_value());
    REQUIRE(cat.delete_record(cid, "missing").error().code == core::error_code::not_found);
    REQUIRE(cat.delete_record(cid, "a").has_value());
    REQUIRE(tx->commit().has_value());
  }
  auto b2 = cat.get_record(cid, "b");
  REQUIRE_FALSE((*b2)->document.has_value());
  REQUIRE((*b2)->metadata == metadata::Metadata{{"only", false}});
  REQUIRE(cat.count_records(cid).value() == 1);
}

TEST_CASE("uncommitted catalog transactions roll back", "[catalog]") {
  test_support::TempDir dir("cairn_catalog");
  auto opened = Catalog::open(dir / "catalog.sqlite3");
  REQUIRE(opened.has_value());
  auto& cat = **opened;
  const auto cid = cat.create_collection("docs", schema_2d())->id;
  {
    auto tx = cat.begin();
    REQUIRE(tx.has_value());
    REQUIRE(cat.put_record(cid, record("a", 1)).has_value());
    REQUIRE(cat.set_committed_seq(cid, 1).has_value());
  }
  REQUIRE(cat.count_records(cid).value() == 0);
  REQUIRE(cat.get_collection(cid)->committed_seq == 0);

  auto tx = cat.begin();
  REQUIRE(tx.has_value());
  REQUIRE(cat.put_record(cid, record("a", 1)).has_value());
  tx->rollback();
  REQUIRE_FALSE(tx->active());
  REQUIRE(cat.count_records(cid).value() == 0);
}

TEST_CASE("deleting a collection removes its records", "[catalog]") {
  test_support::TempDir dir("cairn_catalog");
  auto opened = Catalog::open(dir / "catalog.sqlite3");
  REQUIRE(opened.has_value());
  auto& cat = **opened;
  const auto cid = cat.create_collection("docs", schema_2d())->id;
  {
    auto tx = cat.begin();
    REQUIRE(cat.put_record(cid, record("a", 1, "x", {{"k", std::string("v")}})).has_value());
    REQUIRE(tx->commit().has_value());
  }
  REQUIRE(cat.delete_collection("docs").has_value());
  REQUIRE(cat.count_records(cid).value() == 0);
  REQUIRE(cat.delete_collection("docs").error().code == core::error_code::not_found);
}

TEST_CASE("catalog migrates a v1 database forward", "[catalog][migration]") {
  test_support::TempDir dir("cairn_catalog");
  const auto path = dir / "catalog.sqlite3";
  raw_exec(path, std::string(cairn::catalog::detail::kMigrations[0].sql) +
                     "INSERT INTO meta(key, value) VALUES('schema_version', '1');"
                     "INSERT INTO collections(name, dimension, metric, committed_seq) VALUES('old', 3, 'l2', 4);"
                     "INSERT INTO records(collection_id, record_id, seq, document) VALUES(1, 'r1', 4, 'kept');");

  {
    auto cat = Catalog::open(path, CatalogOptions{.create_if_missing = false, .read_only = true});
    REQUIRE_FALSE(cat.has_value());
    REQUIRE(cat.error().code == core::error_code::version_mismatch);
  }

  auto cat = Catalog::open(path);
  REQUIRE(cat.has_value());
  REQUIRE((*cat)->opened_version() == 1);
  REQUIRE((*cat)->schema_version().value() == 2);
  auto info = (*cat)->get_collection("old");
  REQUIRE(info.has_value());
  REQUIRE(info->schema.index == IndexKind::flat);
  REQUIRE(info->schema.hnsw == HnswParams{});
  REQUIRE(info->committed_seq == 4);
  REQUIRE((*cat)->get_record(info->id, "r1").value()->document == std::optional<std::string>("kept"));
}

TEST_CASE("catalog refuses newer and foreign databases", "[catalog]") {
  test_support::TempDir dir("cairn_catalog");
  const auto path = dir / "catalog.sqlite3";

  SECTION("newer schema is version_mismatch") {
    { REQUIRE(Catalog::open(path).has_value()); }
    raw_exec(path, "UPDATE meta SET value = '99' WHERE key = 'schema_version'");
    auto cat = Catalog::open(path);
    REQUIRE(cat.error().code == core::error_code::version_mismatch);
  }
  SECTION("garbage file is data_integrity") {
    {
      std::ofstream out(path, std::ios::binary);
      out << std::string(8192, 'x');
    }
    auto cat = Catalog::open(path);
    REQUIRE_FALSE(cat.has_value());
    REQUIRE(cat.error().code == core::error_code::data_integrity);
  }
  SECTION("tables without meta is data_integrity") {
    raw_exec(path, "CREATE TABLE stranger(x INTEGER)");
    REQUIRE(Catalog::open(path).error().code == core::error_code::data_integrity);
  }
  SECTION("missing file with create_if_missing=false is not_found") {
    auto cat = Catalog::open(path, CatalogOptions{.create_if_missing = false});
    REQUIRE(cat.error().code == core::error_code::not_found);
  }
}

TEST_CASE("read-only catalog rejects transactions", "[catalog]") {
  test_support::TempDir dir("cairn_catalog");
  const auto path = dir / "catalog.sqlite3";
  {
    auto cat = Catalog::open(path);
    REQUIRE(cat.has_value());
    REQUIRE((*cat)->create_collection("docs", schema_2d()).has_value());
  }
  auto cat = Catalog::open(path, CatalogOptions{.create_if_missing = false, .read_only = true});
  REQUIRE(cat.has_value());
  REQUIRE((*cat)->read_only());
  REQUIRE((*cat)->begin().error().code == core::error_code::read_only);
  REQUIRE((*cat)->list_collections()->size() == 1);
}
