#include <catch2/catch_all.hpp>
#include <cairn/error.hpp>

using namespace cairn::core;

TEST_CASE("error codes keep their family numbering", "[error]") {
  REQUIRE(static_cast<std::uint32_t>(error_code::io_failed) == 1001);
  REQUIRE(static_cast<std::uint32_t>(error_code::permission_denied) == 1002);
  REQUIRE(static_cast<std::uint32_t>(error_code::data_integrity) == 3001);
  REQUIRE(static_cast<std::uint32_t>(error_code::version_mismatch) == 3002);
  REQUIRE(static_cast<std::uint32_t>(error_code::invalid_argument) == 4001);
  REQUIRE(static_cast<std::uint32_t>(error_code::not_found) == 6001);
  REQUIRE(static_cast<std::uint32_t>(error_code::already_exists) == 6002);
  REQUIRE(static_cast<std::uint32_t>(error_code::lock_held) == 7001);
  REQUIRE(static_cast<std::uint32_t>(error_code::closed) == 7002);
  REQUIRE(static_cast<std::uint32_t>(error_code::read_only) == 7003);
  REQUIRE(static_cast<std::uint32_t>(error_code::internal) == 9001);
}

TEST_CASE("error code names", "[error]") {
  REQUIRE(to_string(error_code::data_integrity) == "data_integrity");
  REQUIRE(to_string(error_code::already_exists) == "already_exists");
  REQUIRE(to_string(error_code::lock_held) == "lock_held");
  REQUIRE(to_string(static_cast<error_code>(12345)) == "internal");
}

TEST_CASE("make_unexpected carries code, message and component", "[error]") {
  std::expected<int, error> r = make_unexpected(error_code::not_found, "missing", "unit");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::not_found);
  REQUIRE(r.error().message == "missing");
  REQUIRE(r.error().component == "unit");
}
