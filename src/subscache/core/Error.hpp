#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace SC {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        TooManySubscripts,
        InvalidSubscriptType,
        NotMutable,
        InvalidDepth,
        CorruptDepth,
        SubscriptTooLong,
        PathTooLong,
        InvalidVarname,
        CapacityExceeded
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::TooManySubscripts:
        return "too_many_subscripts";
    case Error::Code::InvalidSubscriptType:
        return "invalid_subscript_type";
    case Error::Code::NotMutable:
        return "not_mutable";
    case Error::Code::InvalidDepth:
        return "invalid_depth";
    case Error::Code::CorruptDepth:
        return "corrupt_depth";
    case Error::Code::SubscriptTooLong:
        return "subscript_too_long";
    case Error::Code::PathTooLong:
        return "path_too_long";
    case Error::Code::InvalidVarname:
        return "invalid_varname";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace SC
