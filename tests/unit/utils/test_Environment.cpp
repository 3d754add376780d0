#include "utils/Environment.hpp"
#include "support/EnvGuard.hpp"

#include <doctest/doctest.h>

using namespace SC;
using SC::testing::EnvGuard;

TEST_SUITE("utils.environment") {

TEST_CASE("parse_truthy") {
    CHECK_FALSE(parse_truthy(nullptr));
    CHECK(parse_truthy(""));
    CHECK(parse_truthy("   "));
    CHECK(parse_truthy("1"));
    CHECK(parse_truthy("yes"));
    CHECK(parse_truthy("on"));
    CHECK_FALSE(parse_truthy("0"));
    CHECK_FALSE(parse_truthy("false"));
    CHECK_FALSE(parse_truthy(" Off "));
    CHECK_FALSE(parse_truthy("NO"));
}

TEST_CASE("split_list trims and skips empty items") {
    auto items = split_list(" a, b,,c ,");
    REQUIRE(items.size() == 3);
    CHECK(items[0] == "a");
    CHECK(items[1] == "b");
    CHECK(items[2] == "c");
    CHECK(split_list("").empty());
    CHECK(split_list("one;two", ';').size() == 2);
}

TEST_CASE("env_size parses whole unsigned numbers") {
    {
        EnvGuard guard("SUBSCACHE_TEST_SIZE", " 42 ");
        auto value = env_size("SUBSCACHE_TEST_SIZE");
        REQUIRE(value.has_value());
        CHECK(*value == 42);
    }
    {
        EnvGuard guard("SUBSCACHE_TEST_SIZE", "42x");
        CHECK_FALSE(env_size("SUBSCACHE_TEST_SIZE").has_value());
    }
    {
        EnvGuard guard("SUBSCACHE_TEST_SIZE", nullptr);
        CHECK_FALSE(env_size("SUBSCACHE_TEST_SIZE").has_value());
    }
}

TEST_CASE("env_truthy and env_list read the environment") {
    EnvGuard flag("SUBSCACHE_TEST_FLAG", "true");
    EnvGuard list("SUBSCACHE_TEST_LIST", "Alpha,Beta");
    CHECK(env_truthy("SUBSCACHE_TEST_FLAG"));
    auto items = env_list("SUBSCACHE_TEST_LIST");
    REQUIRE(items.size() == 2);
    CHECK(items[1] == "Beta");
}

}
