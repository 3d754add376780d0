#pragma once
#include "core/Error.hpp"
#include "path/PathBuffer.hpp"
#include "path/Subscript.hpp"

#include <cstddef>
#include <string_view>

namespace SC {

/**
 * Iteration state over the final subscript of a path.
 *
 * Holds a mutable copy of the path so each step rewrites the last
 * subscript in place. Children appended to path() never share its slots,
 * so they survive later steps unchanged.
 */
class MutableCursor {
public:
    // Copies `path`, which must have at least one subscript.
    [[nodiscard]] static auto from(PathBuffer const& path) -> Expected<MutableCursor>;

    // Cursor over the children of `parent`, starting at `seed`.
    [[nodiscard]] static auto over(PathBuffer const& parent, Subscript const& seed) -> Expected<MutableCursor>;

    auto substitute(Subscript const& value) -> Expected<void>;

    [[nodiscard]] auto path() const noexcept -> PathBuffer const& { return path_; }
    [[nodiscard]] auto depth() const noexcept -> std::size_t { return path_.depth(); }
    [[nodiscard]] auto current() const -> Expected<std::string_view> { return path_.at(-1); }
    [[nodiscard]] auto reallocations() const noexcept -> std::size_t { return reallocations_; }

private:
    explicit MutableCursor(PathBuffer path) : path_(std::move(path)) {}

    PathBuffer  path_;
    std::size_t reallocations_ = 0;
};

} // namespace SC
