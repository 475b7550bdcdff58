#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <string>
#include "cairn/core/platform_utils.hpp"
#include <tests/support/temp_dir.hpp>

using cairn::core::safe_getenv;
using test_support::set_env;

TEST_CASE("safe_getenv returns nullopt when unset", "[platform][env]") {
    const char* key = "CAIRN_TEST_SAFE_GETENV_UNSET";
    set_env(key, nullptr);
    REQUIRE_FALSE(safe_getenv(key).has_value());
}

TEST_CASE("safe_getenv returns value when set", "[platform][env]") {
    const char* key = "CAIRN_TEST_SAFE_GETENV_VALUE";
    set_env(key, "hello_world");
    auto v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == "hello_world");
    set_env(key, nullptr);
}

TEST_CASE("safe_getenv rejects null and empty names", "[platform][env]") {
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("env_flag treats empty and leading zero as off", "[platform][env]") {
    const char* key = "CAIRN_TEST_FLAG";
    set_env(key, "");
    REQUIRE_FALSE(cairn::core::env_flag(key));
    set_env(key, "0");
    REQUIRE_FALSE(cairn::core::env_flag(key));
    set_env(key, "1");
    REQUIRE(cairn::core::env_flag(key));
    set_env(key, "yes");
    REQUIRE(cairn::core::env_flag(key));
    set_env(key, nullptr);
    REQUIRE_FALSE(cairn::core::env_flag(key));
}
