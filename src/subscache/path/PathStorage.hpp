#pragma once
#include "core/Config.hpp"
#include "path/ByteArena.hpp"

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

namespace SC {

/**
 * The owned part of a path: one ByteArena plus the slot table describing
 * the subscripts stored in it.
 *
 * `depth` is the logical depth the storage was built for and never
 * changes. `depthUsed` counts populated slots and only grows, when a
 * shallower path writes a child subscript into a free slot. Slots
 * [0, depthUsed) are contiguous in the arena, directly after the varname.
 */
class PathStorage {
public:
    struct Shape {
        std::size_t depthAlloc   = 0;
        std::size_t byteCapacity = 0; // subscript bytes, excluding the varname
        bool        isMutable    = false;
    };

    PathStorage(std::string_view varname,
                Shape const& shape,
                PathOptions const& options,
                std::pmr::memory_resource* resource);

    PathStorage(PathStorage const&)            = delete;
    PathStorage& operator=(PathStorage const&) = delete;

    [[nodiscard]] auto depth() const noexcept -> std::size_t { return depth_; }
    [[nodiscard]] auto depthUsed() const noexcept -> std::size_t { return depthUsed_; }
    [[nodiscard]] auto depthAlloc() const noexcept -> std::size_t { return slots_.size(); }
    [[nodiscard]] auto byteCapacity() const noexcept -> std::size_t { return arena_.capacity() - varname_.length; }
    [[nodiscard]] auto bytesUsed() const noexcept -> std::size_t { return arena_.used() - varname_.length; }
    [[nodiscard]] auto isMutable() const noexcept -> bool { return mutable_; }
    [[nodiscard]] auto options() const noexcept -> PathOptions const& { return options_; }
    [[nodiscard]] auto resource() const noexcept -> std::pmr::memory_resource* { return resource_; }

    [[nodiscard]] auto varname() const noexcept -> std::string_view { return arena_.view(varname_); }
    [[nodiscard]] auto varnameSlot() const noexcept -> Slot { return varname_; }
    [[nodiscard]] auto slot(std::size_t index) const noexcept -> Slot { return slots_[index]; }
    [[nodiscard]] auto subscript(std::size_t index) const noexcept -> std::string_view {
        return arena_.view(slots_[index]);
    }
    [[nodiscard]] auto base() const noexcept -> char const* { return arena_.data(); }

    // Subscript bytes stored in slots [0, depth).
    [[nodiscard]] auto prefixBytes(std::size_t depth) const noexcept -> std::size_t;

    // Whether the next free slot exists and the arena can hold `length` more bytes.
    [[nodiscard]] auto hasRoomFor(std::size_t length) const noexcept -> bool;

    // Whether the final populated slot can be rewritten with `length` bytes without reallocating.
    [[nodiscard]] auto lastSlotFits(std::size_t length) const noexcept -> bool;

    // Writes into the first free slot; requires hasRoomFor(bytes.size()).
    auto push(std::string_view bytes) noexcept -> void;

    // Copies slots [0, depth) of `source`, rebuilding every offset from this arena's base.
    auto copyPrefix(PathStorage const& source, std::size_t depth) noexcept -> void;

    // Rewrites the final populated slot; requires lastSlotFits(bytes.size()).
    auto overwriteLast(std::string_view bytes) noexcept -> void;

    // Fixes the logical depth once the initial slots are written.
    auto seal() noexcept -> void { depth_ = depthUsed_; }

private:
    ByteArena                  arena_;
    std::pmr::vector<Slot>     slots_;
    Slot                       varname_;
    std::size_t                depth_     = 0;
    std::size_t                depthUsed_ = 0;
    bool                       mutable_   = false;
    PathOptions                options_;
    std::pmr::memory_resource* resource_;
};

} // namespace SC
