#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace SC {

class PathBuffer;

struct RenderedPath {
    std::string varname;
    std::string subscripts; // comma-joined, empty at depth 0
};

/**
 * Quotes raw subscript bytes the way the engine's ZWRITE does: printable
 * runs inside double quotes with embedded quotes doubled, other bytes as
 * $C(n,...) codes, pieces joined with '_'. The empty string is "".
 */
auto quote_subscript(std::string_view bytes) -> std::string;

// Canonical numbers are left bare, everything else is quoted.
auto render_subscript(std::string_view bytes) -> std::string;

auto render(PathBuffer const& path, std::optional<std::size_t> depth = std::nullopt) -> Expected<RenderedPath>;

// "varname(sub1,sub2)" or the bare varname at depth 0.
auto to_string(PathBuffer const& path, std::optional<std::size_t> depth = std::nullopt) -> Expected<std::string>;

} // namespace SC
