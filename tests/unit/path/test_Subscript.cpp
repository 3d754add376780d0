#include "path/Subscript.hpp"

#include <doctest/doctest.h>

#include <array>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

using namespace SC;

TEST_SUITE("path.subscript") {

TEST_CASE("byte subscripts are borrowed as-is") {
    std::string const binary{"a\0b", 3};
    Subscript         sub{binary};
    CHECK(sub.isBytes());
    auto encoded = sub.encode();
    REQUIRE(encoded.has_value());
    CHECK(encoded->bytes().size() == 3);
    CHECK(encoded->bytes().data() == binary.data());
}

TEST_CASE("raw byte spans are accepted") {
    std::array<std::byte, 2> raw{std::byte{0xff}, std::byte{0x00}};
    Subscript                sub{std::span<std::byte const>{raw}};
    auto                     encoded = sub.encode();
    REQUIRE(encoded.has_value());
    CHECK(encoded->bytes() == std::string_view{"\xff\0", 2});
}

TEST_CASE("numbers are coerced to canonical bytes") {
    CHECK_FALSE(Subscript{12}.isBytes());
    CHECK(Subscript{12}.encode()->bytes() == "12");
    CHECK(Subscript{-3L}.encode()->bytes() == "-3");
    CHECK(Subscript{7u}.encode()->bytes() == "7");
    CHECK(Subscript{0.5}.encode()->bytes() == ".5");
    CHECK(Subscript{2.0f}.encode()->bytes() == "2");
}

TEST_CASE("batch validates count, type and length") {
    Limits limits;
    limits.maxSubscriptLength = 4;

    std::vector<Subscript> ok{"ab", 12, "wxyz"};
    auto batch = SubscriptBatch::encode(ok, limits);
    REQUIRE(batch.has_value());
    CHECK(batch->size() == 3);
    CHECK(batch->totalBytes() == 8);
    CHECK((*batch)[1] == "12");

    std::vector<Subscript> tooLong{"ab", "abcde"};
    auto longResult = SubscriptBatch::encode(tooLong, limits);
    REQUIRE_FALSE(longResult.has_value());
    CHECK(longResult.error().code == Error::Code::SubscriptTooLong);

    std::vector<Subscript> badType{"ab", std::numeric_limits<double>::infinity()};
    auto typeResult = SubscriptBatch::encode(badType, limits);
    REQUIRE_FALSE(typeResult.has_value());
    CHECK(typeResult.error().code == Error::Code::InvalidSubscriptType);

    limits.maxSubscripts = 2;
    auto countResult = SubscriptBatch::encode(ok, limits);
    REQUIRE_FALSE(countResult.has_value());
    CHECK(countResult.error().code == Error::Code::TooManySubscripts);
}

TEST_CASE("batch keeps coerced numbers alive after moves") {
    Limits                 limits;
    std::vector<Subscript> subs{1234567, 0.25};
    auto                   batch = SubscriptBatch::encode(subs, limits);
    REQUIRE(batch.has_value());
    SubscriptBatch moved = std::move(*batch);
    CHECK(moved[0] == "1234567");
    CHECK(moved[1] == ".25");
}

}
