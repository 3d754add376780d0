#include "core/Error.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace SC;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::CapacityExceeded);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::TooManySubscripts, "depth 32"};
        CHECK(describeError(withMsg) == "too_many_subscripts:depth 32");

        Error withoutMsg{Error::Code::NotMutable, {}};
        CHECK(describeError(withoutMsg) == "not_mutable");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Labels are distinct") {
        CHECK(errorCodeToString(Error::Code::InvalidDepth) == "invalid_depth");
        CHECK(errorCodeToString(Error::Code::CorruptDepth) == "corrupt_depth");
        CHECK(errorCodeToString(Error::Code::InvalidSubscriptType) == "invalid_subscript_type");
        CHECK(errorCodeToString(Error::Code::PathTooLong) == "path_too_long");
    }
}
