#pragma once
#include "core/Config.hpp"
#include "core/Error.hpp"

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace SC {

/**
 * One subscript argument: either borrowed bytes or a number that is
 * coerced to its canonical numeric bytes when the path is built.
 *
 * Byte arguments are not copied, so a Subscript must not outlive the
 * string it was built from. Paths copy the bytes into their own arena.
 */
class Subscript {
public:
    Subscript(std::string_view bytes) noexcept : value_(bytes) {}
    Subscript(std::string const& bytes) noexcept : value_(std::string_view{bytes}) {}
    Subscript(char const* bytes) noexcept : value_(std::string_view{bytes}) {}
    Subscript(std::span<std::byte const> bytes) noexcept
        : value_(std::string_view{reinterpret_cast<char const*>(bytes.data()), bytes.size()}) {}

    template <std::signed_integral T>
        requires(!std::same_as<T, char>)
    Subscript(T value) noexcept : value_(static_cast<std::int64_t>(value)) {}

    template <std::unsigned_integral T>
        requires(!std::same_as<T, bool> && !std::same_as<T, char>)
    Subscript(T value) noexcept : value_(static_cast<std::uint64_t>(value)) {}

    template <std::floating_point T>
    Subscript(T value) noexcept : value_(static_cast<double>(value)) {}

    Subscript(bool) = delete;

    [[nodiscard]] auto isBytes() const noexcept -> bool {
        return std::holds_alternative<std::string_view>(value_);
    }

    class Encoded;
    [[nodiscard]] auto encode() const -> Expected<Encoded>;

private:
    std::variant<std::string_view, std::int64_t, std::uint64_t, double> value_;
};

// Byte form of a Subscript. Owns the text of coerced numbers.
class Subscript::Encoded {
public:
    Encoded() = default;
    explicit Encoded(std::string_view borrowed) noexcept : borrowed_(borrowed) {}
    explicit Encoded(std::string owned) : owned_(std::move(owned)), isOwned_(true) {}

    [[nodiscard]] auto bytes() const noexcept -> std::string_view {
        return isOwned_ ? std::string_view{owned_} : borrowed_;
    }

private:
    std::string_view borrowed_;
    std::string      owned_;
    bool             isOwned_ = false;
};

/**
 * Fixed-capacity batch of encoded subscripts. Encoding validates the count,
 * the argument types and every subscript's length before a path is touched.
 */
class SubscriptBatch {
public:
    [[nodiscard]] static auto encode(std::span<Subscript const> subscripts, Limits const& limits)
        -> Expected<SubscriptBatch>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return count_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return count_ == 0; }
    [[nodiscard]] auto totalBytes() const noexcept -> std::size_t { return totalBytes_; }
    [[nodiscard]] auto operator[](std::size_t index) const noexcept -> std::string_view {
        return items_[index].bytes();
    }

private:
    std::array<Subscript::Encoded, kMaxSubscripts> items_{};
    std::size_t                                    count_      = 0;
    std::size_t                                    totalBytes_ = 0;
};

} // namespace SC
