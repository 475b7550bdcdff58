#include <catch2/catch_all.hpp>
#include <cairn/core/bytes.hpp>
#include <cairn/index/segment.hpp>
#include <tests/support/temp_dir.hpp>

#include <filesystem>

using namespace cairn;
using namespace cairn::index;

TEST_CASE("byte writer stores integers little-endian", "[segment]") {
  core::ByteWriter w;
  w.put_u16(0x0102);
  w.put_u32(0x01020304u);
  w.put_u64(0x0102030405060708ull);
  const std::vector<std::uint8_t> expect{2, 1, 4, 3, 2, 1, 8, 7, 6, 5, 4, 3, 2, 1};
  const auto got = w.bytes();
  REQUIRE(std::vector<std::uint8_t>(got.begin(), got.end()) == expect);

  core::ByteReader r(got);
  std::uint16_t a = 0;
  std::uint32_t b = 0;
  std::uint64_t c = 0;
  REQUIRE((r.get_u16(a) && r.get_u32(b) && r.get_u64(c)));
  REQUIRE(a == 0x0102);
  REQUIRE(b == 0x01020304u);
  REQUIRE(c == 0x0102030405060708ull);
  REQUIRE(r.at_end());
  std::uint8_t extra = 0;
  REQUIRE_FALSE(r.get_u8(extra));
}

TEST_CASE("upsert and tombstone payloads decode", "[segment]") {
  const std::vector<float> v{1.0f, -2.5f, 3.25f};
  auto up = decode_upsert(encode_upsert("doc-1", v), 3);
  REQUIRE(up.has_value());
  REQUIRE(up->id == "doc-1");
  REQUIRE(up->vector == v);

  auto wrong_dim = decode_upsert(encode_upsert("doc-1", v), 4);
  REQUIRE(wrong_dim.error().code == core::error_code::data_integrity);

  auto bytes = encode_upsert("doc-1", v);
  bytes.pop_back();
  REQUIRE_FALSE(decode_upsert(bytes, 3).has_value());

  auto ts = decode_tombstone(encode_tombstone("gone"));
  REQUIRE(ts.has_value());
  REQUIRE(*ts == "gone");
  REQUIRE_FALSE(decode_tombstone(std::vector<std::uint8_t>{1, 2}).has_value());
}

TEST_CASE("segment write and read", "[segment]") {
  test_support::TempDir dir("cairn_seg");
  const auto path = dir / "vectors.seg";

  SECTION("missing segment is nullopt") {
    auto r = read_segment(path, 2, kernels::Metric::l2);
    REQUIRE(r.has_value());
    REQUIRE_FALSE(r->has_value());
  }

  SegmentImage img;
  img.cutoff = 9;
  img.ids = {"a", "b", "c"};
  img.seqs = {2, 5, 9};
  img.data = {0.0f, 1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
  REQUIRE(write_segment(path, 2, kernels::Metric::ip, img).has_value());

  SECTION("contents survive") {
    auto r = read_segment(path, 2, kernels::Metric::ip);
    REQUIRE(r.has_value());
    REQUIRE(r->has_value());
    const auto& got = **r;
    REQUIRE(got.cutoff == 9);
    REQUIRE(got.ids == img.ids);
    REQUIRE(got.seqs == img.seqs);
    REQUIRE(got.data == img.data);
  }

  SECTION("metric or dimension mismatch is data_integrity") {
    REQUIRE(read_segment(path, 2, kernels::Metric::l2).error().code == core::error_code::data_integrity);
    REQUIRE(read_segment(path, 3, kernels::Metric::ip).error().code == core::error_code::data_integrity);
  }

  SECTION("a truncated segment is data_integrity") {
    const auto size = std::filesystem::file_size(path);
    std::filesystem::resize_file(path, size - 3);
    REQUIRE(read_segment(path, 2, kernels::Metric::ip).error().code == core::error_code::data_integrity);
  }

  SECTION("a flipped byte is data_integrity") {
    test_support::clobber(path, 30, 1, 0xEE);
    REQUIRE(read_segment(path, 2, kernels::Metric::ip).error().code == core::error_code::data_integrity);
  }
}

TEST_CASE("segment rejects inconsistent images", "[segment]") {
  test_support::TempDir dir("cairn_seg");
  SegmentImage img;
  img.ids = {"a"};
  img.seqs = {1};
  img.data = {1.0f};
  REQUIRE(write_segment(dir / "x.seg", 2, kernels::Metric::l2, img).error().code == core::error_code::internal);
}
