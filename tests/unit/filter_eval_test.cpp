#include <catch2/catch_all.hpp>
#include <cairn/filter_eval.hpp>
#include <cairn/filter_expr.hpp>

#include <limits>

using namespace cairn;
using metadata::Metadata;

TEST_CASE("filter eval basic semantics", "[filter]") {
  Metadata md1{{"color", std::string("red")}, {"shape", std::string("circle")}, {"price", 9.99}};
  Metadata md2{{"color", std::string("blue")}, {"price", 5.0}};

  filter_expr t_red{term{"color", std::string("red")}};
  filter_expr t_blue{term{"color", std::string("blue")}};
  filter_expr r_mid{range{"price", 6.0, 10.0}};
  filter_expr both{filter_expr::and_t{{t_red, r_mid}}};
  filter_expr any{filter_expr::or_t{{t_red, t_blue}}};
  filter_expr none{filter_expr::not_t{{t_red, t_blue}}};
  filter_expr empty_and{filter_expr::and_t{{}}};
  filter_expr empty_or{filter_expr::or_t{{}}};
  filter_expr empty_not{filter_expr::not_t{{}}};

  REQUIRE(filter_eval::matches(t_red, md1));
  REQUIRE_FALSE(filter_eval::matches(t_red, md2));
  REQUIRE(filter_eval::matches(r_mid, md1));
  REQUIRE_FALSE(filter_eval::matches(r_mid, md2));
  REQUIRE(filter_eval::matches(both, md1));
  REQUIRE(filter_eval::matches(any, md1));
  REQUIRE_FALSE(filter_eval::matches(none, md1));
  REQUIRE(filter_eval::matches(empty_and, md2));
  REQUIRE_FALSE(filter_eval::matches(empty_or, md2));
  REQUIRE(filter_eval::matches(empty_not, md2));
}

TEST_CASE("terms compare typed values, numbers numerically", "[filter]") {
  Metadata md{{"year", std::int64_t{2020}}, {"draft", false}, {"tag", std::string("2020")}};
  REQUIRE(filter_eval::matches(filter_expr{term{"year", 2020.0}}, md));
  REQUIRE(filter_eval::matches(filter_expr{term{"year", std::int64_t{2020}}}, md));
  REQUIRE_FALSE(filter_eval::matches(filter_expr{term{"tag", std::int64_t{2020}}}, md));
  REQUIRE(filter_eval::matches(filter_expr{term{"draft", false}}, md));
  REQUIRE_FALSE(filter_eval::matches(filter_expr{term{"missing", true}}, md));
  // ranges ignore non-numeric values
  REQUIRE_FALSE(filter_eval::matches(filter_expr{range{"tag", 0.0, 5000.0}}, md));
  REQUIRE(filter_eval::matches(filter_expr{range{"year", 2020.0, 2020.0}}, md));
}

TEST_CASE("filter validation", "[filter]") {
  REQUIRE(filter_eval::validate(filter_expr{term{"a", true}}).has_value());
  REQUIRE_FALSE(filter_eval::validate(filter_expr{term{"", true}}).has_value());
  REQUIRE_FALSE(filter_eval::validate(filter_expr{range{"p", 5.0, 1.0}}).has_value());
  REQUIRE_FALSE(filter_eval::validate(filter_expr{range{"p", std::numeric_limits<double>::quiet_NaN(), 1.0}}).has_value());
  filter_expr nested{filter_expr::and_t{{filter_expr{term{"a", true}}, filter_expr{range{"", 0.0, 1.0}}}}};
  auto r = filter_eval::validate(nested);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::invalid_argument);
}
