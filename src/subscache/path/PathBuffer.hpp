#pragma once
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "path/KeyArgs.hpp"
#include "path/PathStorage.hpp"
#include "path/Subscript.hpp"

#include <array>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace SC {

class PathBuffer;

namespace testing {
struct PathBufferAccess;
} // namespace testing

/**
 * Cached representation of one database key: a varname plus an ordered list
 * of binary subscripts, laid out the way the engine expects to receive them.
 *
 * A PathBuffer is a cheap handle. It either owns its storage (shared with
 * copies of the handle) or is a view: a different depth over another
 * buffer's storage, keeping that storage alive. Appending writes into free
 * or byte-identical slots when no live handle can observe the change and
 * copies the path otherwise.
 *
 * Mutable buffers, produced by toMutable(), carry no spare slots so any
 * append reallocates, which is what lets substitute() rewrite their final
 * subscript in place.
 */
class PathBuffer {
public:
    struct Flags {
        bool isMutable = false;
        bool isView    = false;
    };

    struct Stats {
        std::size_t depth        = 0;
        std::size_t depthUsed    = 0;
        std::size_t depthAlloc   = 0;
        std::size_t byteCapacity = 0;
        std::size_t bytesUsed    = 0;
        long        useCount     = 0;
        Flags       flags;
    };

    // Heap-allocated path.
    [[nodiscard]] static auto create(std::string_view varname,
                                     std::span<Subscript const> subscripts = {},
                                     PathOptions const& options = defaultOptions()) -> Expected<PathBuffer>;
    [[nodiscard]] static auto create(std::string_view varname,
                                     std::initializer_list<Subscript> subscripts,
                                     PathOptions const& options = defaultOptions()) -> Expected<PathBuffer>;

    template <typename... Subscripts>
    [[nodiscard]] static auto of(std::string_view varname, Subscripts&&... subscripts) -> Expected<PathBuffer> {
        std::array<Subscript, sizeof...(Subscripts)> const list{Subscript(std::forward<Subscripts>(subscripts))...};
        return create(varname, std::span<Subscript const>{list});
    }

    // Path drawing all of its memory from `scratch`, which must outlive it.
    // Paths derived from it by reallocation live on the heap.
    [[nodiscard]] static auto createTransient(std::pmr::memory_resource& scratch,
                                              std::string_view varname,
                                              std::span<Subscript const> subscripts = {},
                                              PathOptions const& options = defaultOptions()) -> Expected<PathBuffer>;
    [[nodiscard]] static auto createTransient(std::pmr::memory_resource& scratch,
                                              std::string_view varname,
                                              std::initializer_list<Subscript> subscripts,
                                              PathOptions const& options = defaultOptions()) -> Expected<PathBuffer>;

    // Independent copy of `base` extended by `subscripts`; never shares storage.
    [[nodiscard]] static auto derive(PathBuffer const& base, std::span<Subscript const> subscripts) -> Expected<PathBuffer>;
    [[nodiscard]] static auto derive(PathBuffer const& base, std::initializer_list<Subscript> subscripts) -> Expected<PathBuffer>;

    [[nodiscard]] auto append(std::span<Subscript const> subscripts) const -> Expected<PathBuffer>;
    [[nodiscard]] auto append(std::initializer_list<Subscript> subscripts) const -> Expected<PathBuffer>;

    // Appends starting at `depth`, which may be shallower than this path's own depth.
    [[nodiscard]] auto appendAt(std::size_t depth, std::span<Subscript const> subscripts) const -> Expected<PathBuffer>;
    [[nodiscard]] auto appendAt(std::size_t depth, std::initializer_list<Subscript> subscripts) const -> Expected<PathBuffer>;

    [[nodiscard]] auto toMutable() const -> Expected<PathBuffer>;

    // Replaces the final subscript of a mutable buffer. The returned buffer
    // supersedes this one; it is the same storage unless the new bytes did not fit.
    [[nodiscard]] auto substitute(Subscript const& value) const -> Expected<PathBuffer>;

    [[nodiscard]] auto depth() const noexcept -> std::size_t;
    [[nodiscard]] auto varname() const noexcept -> std::string_view;

    // Depth 0 is the varname, 1..depth() the subscripts, negative depths count back from the last subscript.
    [[nodiscard]] auto at(std::ptrdiff_t depth) const -> Expected<std::string_view>;
    [[nodiscard]] auto subscripts() const -> Expected<std::vector<std::string_view>>;

    [[nodiscard]] auto isMutable() const noexcept -> bool;
    [[nodiscard]] auto isView() const noexcept -> bool;
    [[nodiscard]] auto flags() const noexcept -> Flags;
    [[nodiscard]] auto stats() const -> Expected<Stats>;
    [[nodiscard]] auto sharesStorageWith(PathBuffer const& other) const noexcept -> bool;

    [[nodiscard]] auto keyArgs() const -> Expected<KeyArgs>;

private:
    friend struct testing::PathBufferAccess;

    struct Owned {
        std::shared_ptr<PathStorage> storage;
    };
    struct View {
        std::shared_ptr<PathStorage> root;
        std::ptrdiff_t               depth = 0;
    };
    struct Resolved {
        PathStorage* storage = nullptr;
        std::size_t  depth   = 0;
    };

    explicit PathBuffer(Owned owned) : repr_(std::move(owned)) {}
    explicit PathBuffer(View view) : repr_(std::move(view)) {}

    [[nodiscard]] auto storagePtr() const noexcept -> std::shared_ptr<PathStorage> const&;
    [[nodiscard]] auto resolve() const -> Expected<Resolved>;
    [[nodiscard]] auto withDepth(std::size_t depth) const -> PathBuffer;

    [[nodiscard]] static auto build(std::pmr::memory_resource* resource,
                                    std::string_view varname,
                                    std::span<Subscript const> subscripts,
                                    PathOptions const& options) -> Expected<PathBuffer>;

    std::variant<Owned, View> repr_;
};

} // namespace SC
