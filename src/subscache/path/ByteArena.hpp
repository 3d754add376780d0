#pragma once
#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

namespace SC {

// Byte range of one component inside a ByteArena.
struct Slot {
    std::size_t offset = 0;
    std::size_t length = 0;

    [[nodiscard]] auto end() const noexcept -> std::size_t { return offset + length; }
};

/**
 * Contiguous byte buffer holding the varname followed by every subscript of
 * one allocation. The capacity is fixed at construction; growing means
 * building a new arena and copying into it.
 */
class ByteArena {
public:
    ByteArena(std::size_t capacity, std::pmr::memory_resource* resource);

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return bytes_.size(); }
    [[nodiscard]] auto used() const noexcept -> std::size_t { return used_; }
    [[nodiscard]] auto slack() const noexcept -> std::size_t { return bytes_.size() - used_; }
    [[nodiscard]] auto data() const noexcept -> char const* { return bytes_.data(); }

    [[nodiscard]] auto view(Slot slot) const noexcept -> std::string_view {
        return {bytes_.data() + slot.offset, slot.length};
    }

    // Requires bytes.size() <= slack().
    auto append(std::string_view bytes) noexcept -> Slot;

    // Replaces everything from offset onwards; requires offset + bytes.size() <= capacity().
    auto overwriteFrom(std::size_t offset, std::string_view bytes) noexcept -> Slot;

private:
    std::pmr::vector<char> bytes_;
    std::size_t            used_ = 0;
};

} // namespace SC
