#include "path/PathStorage.hpp"

namespace SC {

PathStorage::PathStorage(std::string_view varname,
                         Shape const& shape,
                         PathOptions const& options,
                         std::pmr::memory_resource* resource)
    : arena_(varname.size() + shape.byteCapacity, resource)
    , slots_(shape.depthAlloc, Slot{}, std::pmr::polymorphic_allocator<Slot>{resource})
    , mutable_(shape.isMutable)
    , options_(options)
    , resource_(resource) {
    this->varname_ = this->arena_.append(varname);
}

auto PathStorage::prefixBytes(std::size_t depth) const noexcept -> std::size_t {
    if (depth == 0) {
        return 0;
    }
    return this->slots_[depth - 1].end() - this->varname_.length;
}

auto PathStorage::hasRoomFor(std::size_t length) const noexcept -> bool {
    return this->depthUsed_ < this->slots_.size() && length <= this->arena_.slack();
}

auto PathStorage::lastSlotFits(std::size_t length) const noexcept -> bool {
    if (this->depthUsed_ == 0) {
        return false;
    }
    return this->slots_[this->depthUsed_ - 1].offset + length <= this->arena_.capacity();
}

auto PathStorage::push(std::string_view bytes) noexcept -> void {
    this->slots_[this->depthUsed_++] = this->arena_.append(bytes);
}

auto PathStorage::copyPrefix(PathStorage const& source, std::size_t depth) noexcept -> void {
    for (std::size_t index = 0; index < depth; ++index) {
        this->push(source.subscript(index));
    }
}

auto PathStorage::overwriteLast(std::string_view bytes) noexcept -> void {
    auto& last = this->slots_[this->depthUsed_ - 1];
    last       = this->arena_.overwriteFrom(last.offset, bytes);
}

} // namespace SC
