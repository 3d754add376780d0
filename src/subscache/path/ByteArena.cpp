#include "path/ByteArena.hpp"

#include <cstring>

namespace SC {

ByteArena::ByteArena(std::size_t capacity, std::pmr::memory_resource* resource)
    : bytes_(capacity, '\0', std::pmr::polymorphic_allocator<char>{resource}) {}

auto ByteArena::append(std::string_view bytes) noexcept -> Slot {
    Slot slot{this->used_, bytes.size()};
    if (!bytes.empty()) {
        std::memcpy(this->bytes_.data() + this->used_, bytes.data(), bytes.size());
    }
    this->used_ += bytes.size();
    return slot;
}

auto ByteArena::overwriteFrom(std::size_t offset, std::string_view bytes) noexcept -> Slot {
    if (!bytes.empty()) {
        std::memmove(this->bytes_.data() + offset, bytes.data(), bytes.size());
    }
    this->used_ = offset + bytes.size();
    return Slot{offset, bytes.size()};
}

} // namespace SC
