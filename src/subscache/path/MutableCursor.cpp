#include "path/MutableCursor.hpp"

#include "log/TaggedLogger.hpp"

#include <string>

namespace SC {

auto MutableCursor::from(PathBuffer const& path) -> Expected<MutableCursor> {
    if (path.depth() == 0) {
        return std::unexpected(Error{Error::Code::InvalidDepth, "Cursor needs a path with at least one subscript"});
    }
    auto copy = path.toMutable();
    if (!copy) {
        return std::unexpected(copy.error());
    }
    return MutableCursor{std::move(*copy)};
}

auto MutableCursor::over(PathBuffer const& parent, Subscript const& seed) -> Expected<MutableCursor> {
    auto child = parent.append({seed});
    if (!child) {
        return std::unexpected(child.error());
    }
    return from(*child);
}

auto MutableCursor::substitute(Subscript const& value) -> Expected<void> {
    auto next = this->path_.substitute(value);
    if (!next) {
        return std::unexpected(next.error());
    }
    if (!next->sharesStorageWith(this->path_)) {
        ++this->reallocations_;
        sc_log("Cursor reallocated, " + std::to_string(this->reallocations_) + " so far", "Cursor");
    }
    this->path_ = std::move(*next);
    return {};
}

} // namespace SC
