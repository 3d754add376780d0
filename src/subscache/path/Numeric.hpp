#pragma once
#include "core/Error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace SC {

/**
 * Canonical numeric form used by the engine for numeric subscripts: an
 * optional '-', no leading zeros, no '0' before the decimal point, no
 * trailing fractional zeros, and never "-0". Examples: "0", "42", "-7",
 * "3.25", ".5", "-.125". The value must also round-trip through the
 * engine: at most 18 significant digits and a magnitude in [1E-43, 1E47).
 */
auto is_canonical_number(std::string_view bytes) noexcept -> bool;

// Integers beyond 18 significant digits keep their decimal bytes but are
// stored by the engine as strings.
auto canonical_number(std::int64_t value) -> std::string;
auto canonical_number(std::uint64_t value) -> std::string;

// Fails with InvalidSubscriptType for NaN and infinities.
auto canonical_number(double value) -> Expected<std::string>;

} // namespace SC
