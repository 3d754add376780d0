#include "path/Numeric.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <limits>

namespace {

// The engine keeps 18 significant digits and magnitudes in [1E-43, 1E47).
constexpr std::size_t    kMaxSignificantDigits = 18;
constexpr std::ptrdiff_t kMaxDecimalExponent   = 46;
constexpr std::ptrdiff_t kMinDecimalExponent   = -43;

auto is_digit(char ch) noexcept -> bool {
    return ch >= '0' && ch <= '9';
}

// `integer` has no leading zeros, `fraction` no trailing zeros; either may be empty.
auto within_engine_precision(std::string_view integer, std::string_view fraction) noexcept -> bool {
    if (integer.empty() || integer == "0") {
        auto const leadingZeros = fraction.find_first_not_of('0');
        if (leadingZeros == std::string_view::npos) {
            return true;
        }
        auto const exponent = -static_cast<std::ptrdiff_t>(leadingZeros) - 1;
        return fraction.size() - leadingZeros <= kMaxSignificantDigits && exponent >= kMinDecimalExponent;
    }
    auto const exponent = static_cast<std::ptrdiff_t>(integer.size()) - 1;
    if (exponent > kMaxDecimalExponent) {
        return false;
    }
    if (!fraction.empty()) {
        return integer.size() + fraction.size() <= kMaxSignificantDigits;
    }
    auto const lastNonZero = integer.find_last_not_of('0');
    return lastNonZero + 1 <= kMaxSignificantDigits;
}

} // namespace

namespace SC {

auto is_canonical_number(std::string_view bytes) noexcept -> bool {
    std::size_t pos      = 0;
    bool const  negative = !bytes.empty() && bytes.front() == '-';
    if (negative) {
        pos = 1;
    }
    if (pos == bytes.size()) {
        return false;
    }

    auto const intStart = pos;
    while (pos < bytes.size() && is_digit(bytes[pos])) {
        ++pos;
    }
    auto const intLen = pos - intStart;
    if (intLen > 1 && bytes[intStart] == '0') {
        return false;
    }
    bool const zeroInteger = intLen == 1 && bytes[intStart] == '0';
    auto const integer     = bytes.substr(intStart, intLen);

    if (pos == bytes.size()) {
        return intLen > 0 && !(negative && zeroInteger) && within_engine_precision(integer, {});
    }
    if (bytes[pos] != '.' || zeroInteger) {
        return false;
    }
    ++pos;
    auto const fracStart = pos;
    while (pos < bytes.size() && is_digit(bytes[pos])) {
        ++pos;
    }
    if (pos != bytes.size() || pos == fracStart || bytes.back() == '0') {
        return false;
    }
    return within_engine_precision(integer, bytes.substr(fracStart));
}

auto canonical_number(std::int64_t value) -> std::string {
    std::array<char, 24> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    (void)ec;
    return std::string(buffer.data(), ptr);
}

auto canonical_number(std::uint64_t value) -> std::string {
    std::array<char, 24> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    (void)ec;
    return std::string(buffer.data(), ptr);
}

auto canonical_number(double value) -> Expected<std::string> {
    if (!std::isfinite(value)) {
        return std::unexpected(Error{Error::Code::InvalidSubscriptType,
                                     "Non-finite number cannot be used as a subscript"});
    }
    constexpr double kInt64Bound = 9223372036854775808.0; // 2^63
    if (value == std::trunc(value) && value > -kInt64Bound && value < kInt64Bound) {
        return canonical_number(static_cast<std::int64_t>(value));
    }

    // Shortest round-trip digits without an exponent.
    std::array<char, 400> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed);
    if (ec != std::errc{}) {
        return std::unexpected(Error{Error::Code::InvalidSubscriptType, "Number cannot be formatted as a subscript"});
    }
    std::string text(buffer.data(), ptr);

    auto const point = text.find('.');
    if (point != std::string::npos) {
        while (text.back() == '0') {
            text.pop_back();
        }
        if (text.back() == '.') {
            text.pop_back();
        }
    }
    auto const digitsStart = (!text.empty() && text.front() == '-') ? std::size_t{1} : std::size_t{0};
    if (text.size() > digitsStart + 1 && text[digitsStart] == '0' && text[digitsStart + 1] == '.') {
        text.erase(digitsStart, 1);
    }
    return text;
}

} // namespace SC
