#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <optional>
#include <string>
#include "criteria/core/platform_utils.hpp"

using criteria::core::env_flag;
using criteria::core::safe_getenv;

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

static void unset_env_var(const char* name) {
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

TEST_CASE("safe_getenv returns nullopt when unset", "[platform][env]") {
    const char* key = "CRITERIA_TEST_SAFE_GETENV_UNSET";
    unset_env_var(key);
    REQUIRE_FALSE(safe_getenv(key).has_value());
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("safe_getenv returns value when set", "[platform][env]") {
    const char* key = "CRITERIA_TEST_SAFE_GETENV_VALUE";
    set_env_var(key, "hello_world");
    auto v = safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == std::string("hello_world"));
    unset_env_var(key);
}

TEST_CASE("env_flag follows the on/off convention", "[platform][env]") {
    const char* key = "CRITERIA_TEST_ENV_FLAG";
    unset_env_var(key);
    REQUIRE_FALSE(env_flag(key));
    set_env_var(key, "1");
    REQUIRE(env_flag(key));
    set_env_var(key, "yes");
    REQUIRE(env_flag(key));
    set_env_var(key, "0");
    REQUIRE_FALSE(env_flag(key));
#if !defined(_WIN32)
    set_env_var(key, "");
    REQUIRE_FALSE(env_flag(key));
#endif
    unset_env_var(key);
}
