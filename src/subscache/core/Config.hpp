#pragma once
#include <cstddef>

namespace SC {

// Engine limits.
inline constexpr std::size_t kMaxSubscripts      = 31;
inline constexpr std::size_t kMaxIdentLength     = 31;
inline constexpr std::size_t kMaxKeyLength       = 1019;
inline constexpr std::size_t kMaxStringLength    = 1024 * 1024;

inline constexpr std::size_t kOverallocSlots         = 5;
inline constexpr std::size_t kTypicalSubscriptLength = 10;
inline constexpr std::size_t kLargeSubscriptsLength  = kTypicalSubscriptLength * kMaxSubscripts;

struct Limits {
    std::size_t maxSubscripts      = kMaxSubscripts;
    std::size_t maxVarnameLength   = kMaxIdentLength + 1; // leading '^'
    std::size_t maxSubscriptLength = kMaxKeyLength;
    std::size_t maxPathLength      = kMaxStringLength;
};

/**
 * Sizing of new allocations. Every allocation reserves `overallocSlots`
 * spare slots and `overallocSlots * typicalSubscriptLength` spare bytes so
 * that shallow extensions of a path land in place.
 */
struct GrowthPolicy {
    std::size_t overallocSlots         = kOverallocSlots;
    std::size_t typicalSubscriptLength = kTypicalSubscriptLength;

    [[nodiscard]] auto headroomBytes() const noexcept -> std::size_t {
        return overallocSlots * typicalSubscriptLength;
    }
    [[nodiscard]] auto slotCapacity(std::size_t depth, Limits const& limits) const noexcept -> std::size_t;
    [[nodiscard]] auto byteCapacity(std::size_t bytesNeeded, Limits const& limits) const noexcept -> std::size_t;
};

struct PathOptions {
    Limits       limits;
    GrowthPolicy growth;

    // Clamps limits to what the engine accepts.
    [[nodiscard]] auto sanitized() const noexcept -> PathOptions;
};

auto loadOptionsFromEnvironment() -> PathOptions;

// Cached result of loadOptionsFromEnvironment().
auto defaultOptions() -> PathOptions const&;

} // namespace SC
