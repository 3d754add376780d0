#include "path/KeyArgs.hpp"

#include "path/PathBuffer.hpp"

#include <doctest/doctest.h>

using namespace SC;

TEST_SUITE("path.keyargs") {

TEST_CASE("key arguments point into the path arena") {
    auto path = PathBuffer::of("^key", "first", 22, "third");
    REQUIRE(path.has_value());

    auto args = path->keyArgs();
    REQUIRE(args.has_value());
    CHECK(args->varname.view() == "^key");
    CHECK(args->subs_used == 3);
    CHECK(args->subsarray[0].view() == "first");
    CHECK(args->subsarray[1].view() == "22");
    CHECK(args->subsarray[2].view() == "third");
    CHECK(args->subsarray[0].len_alloc == args->subsarray[0].len_used);

    // Subscripts are contiguous after the varname.
    CHECK(args->subsarray[0].buf_addr == args->varname.buf_addr + 4);
    CHECK(args->subsarray[1].buf_addr == args->subsarray[0].buf_addr + 5);
    CHECK(args->subsarray[2].buf_addr == args->subsarray[1].buf_addr + 2);
    CHECK(args->subsarray[3].buf_addr == nullptr);
}

TEST_CASE("views expose only their own depth") {
    auto root = PathBuffer::of("^key");
    REQUIRE(root.has_value());
    auto deep = root->append({"a", "b"});
    REQUIRE(deep.has_value());
    auto shallow = root->append({"a"});
    REQUIRE(shallow.has_value());
    CHECK(shallow->sharesStorageWith(*deep));

    auto args = shallow->keyArgs();
    REQUIRE(args.has_value());
    CHECK(args->subs_used == 1);
    CHECK(args->subsarray[0].view() == "a");
    CHECK(args->subsarray[1].buf_addr == nullptr);

    auto rootArgs = root->keyArgs();
    REQUIRE(rootArgs.has_value());
    CHECK(rootArgs->subs_used == 0);
}

}
