#include <catch2/catch_all.hpp>
#include <cairn/metadata/metadata.hpp>
#include <cairn/schema.hpp>

#include <limits>

using namespace cairn;
using namespace cairn::metadata;

TEST_CASE("empty schema accepts arbitrary metadata", "[metadata]") {
  Metadata md{{"title", std::string("a")}, {"score", 0.5}, {"n", std::int64_t{3}}, {"ok", true}};
  REQUIRE(validate(md, MetadataSchema{}).has_value());
}

TEST_CASE("declared types are enforced, integers count as numbers", "[metadata]") {
  MetadataSchema s;
  s.fields["score"] = FieldSpec{ValueType::number, false};
  s.fields["year"] = FieldSpec{ValueType::integer, false};

  REQUIRE(validate(Metadata{{"score", std::int64_t{4}}}, s).has_value());
  REQUIRE(validate(Metadata{{"score", 4.5}}, s).has_value());
  auto bad = validate(Metadata{{"year", 2001.5}}, s);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == core::error_code::invalid_argument);
  REQUIRE(bad.error().message.find("year") != std::string::npos);
  REQUIRE_FALSE(validate(Metadata{{"score", std::string("high")}}, s).has_value());
}

TEST_CASE("required and strict schemas", "[metadata]") {
  MetadataSchema s;
  s.fields["lang"] = FieldSpec{ValueType::string, true};
  REQUIRE_FALSE(validate(Metadata{}, s).has_value());
  REQUIRE(validate(Metadata{{"lang", std::string("en")}, {"extra", true}}, s).has_value());
  s.strict = true;
  REQUIRE_FALSE(validate(Metadata{{"lang", std::string("en")}, {"extra", true}}, s).has_value());
}

TEST_CASE("metadata rejects empty keys and non-finite numbers", "[metadata]") {
  REQUIRE_FALSE(validate(Metadata{{"", true}}, MetadataSchema{}).has_value());
  REQUIRE_FALSE(validate(Metadata{{"x", std::numeric_limits<double>::quiet_NaN()}}, MetadataSchema{}).has_value());
  REQUIRE_FALSE(validate(Metadata{{"x", std::numeric_limits<double>::infinity()}}, MetadataSchema{}).has_value());
}

TEST_CASE("type names round-trip", "[metadata]") {
  for (auto t : {ValueType::string, ValueType::number, ValueType::integer, ValueType::boolean}) {
    REQUIRE(parse_type(type_name(t)) == t);
  }
  REQUIRE_FALSE(parse_type("date").has_value());
}

TEST_CASE("collection names", "[schema]") {
  REQUIRE(validate_collection_name("docs").has_value());
  REQUIRE(validate_collection_name("my-docs_v1.2").has_value());
  REQUIRE_FALSE(validate_collection_name("").has_value());
  REQUIRE_FALSE(validate_collection_name("-docs").has_value());
  REQUIRE_FALSE(validate_collection_name("docs.").has_value());
  REQUIRE_FALSE(validate_collection_name("a b").has_value());
  REQUIRE_FALSE(validate_collection_name("../etc").has_value());
  REQUIRE(validate_collection_name(std::string(128, 'a')).has_value());
  REQUIRE_FALSE(validate_collection_name(std::string(129, 'a')).has_value());
}

TEST_CASE("schema and record id validation", "[schema]") {
  CollectionSchema s;
  REQUIRE_FALSE(validate_schema(s).has_value());  // dimension 0
  s.dimension = 4;
  REQUIRE(validate_schema(s).has_value());
  s.index = IndexKind::hnsw;
  s.hnsw.M = 1;
  REQUIRE_FALSE(validate_schema(s).has_value());
  s.hnsw.M = 16;
  s.hnsw.ef_construction = 8;
  REQUIRE_FALSE(validate_schema(s).has_value());
  s.hnsw.ef_construction = 100;
  REQUIRE(validate_schema(s).has_value());

  REQUIRE(validate_record_id("id-1").has_value());
  REQUIRE_FALSE(validate_record_id("").has_value());
  REQUIRE_FALSE(validate_record_id(std::string(513, 'x')).has_value());
  REQUIRE_FALSE(validate_record_id(std::string("a\0b", 3)).has_value());
}
