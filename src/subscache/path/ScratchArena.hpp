#pragma once
#include "core/Config.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <memory_resource>
#include <new>

namespace SC {

// Room for one path at the engine's subscript limit with typical subscript lengths.
inline constexpr std::size_t kDefaultScratchSize = 2048;

/**
 * Fixed-size bump allocator for transient paths built for a single call.
 *
 * Deallocation is a no-op; the whole region is reclaimed by reset() or by
 * destroying the arena, which must outlive every path built from it.
 * Exhaustion throws std::bad_alloc like any memory_resource.
 */
template <std::size_t Size = kDefaultScratchSize>
class ScratchArena final : public std::pmr::memory_resource {
public:
    ScratchArena() = default;

    ScratchArena(ScratchArena const&)            = delete;
    ScratchArena& operator=(ScratchArena const&) = delete;

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return Size; }
    [[nodiscard]] auto used() const noexcept -> std::size_t { return used_; }
    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return Size - used_; }

    auto reset() noexcept -> void { used_ = 0; }

private:
    auto do_allocate(std::size_t bytes, std::size_t alignment) -> void* override {
        void*       cursor = region_.data() + used_;
        std::size_t space  = Size - used_;
        if (std::align(alignment, bytes, cursor, space) == nullptr) {
            throw std::bad_alloc();
        }
        used_ = static_cast<std::size_t>(static_cast<std::byte*>(cursor) - region_.data()) + bytes;
        return cursor;
    }

    auto do_deallocate(void*, std::size_t, std::size_t) -> void override {}

    auto do_is_equal(std::pmr::memory_resource const& other) const noexcept -> bool override {
        return this == &other;
    }

    alignas(std::max_align_t) std::array<std::byte, Size> region_;
    std::size_t used_ = 0;
};

} // namespace SC
