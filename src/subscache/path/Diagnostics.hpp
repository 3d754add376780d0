#pragma once
#include "core/Error.hpp"

#include <string>

namespace SC {

class PathBuffer;

/**
 * JSON summary of a path for error reports and debugging: the rendered key,
 * each rendered subscript, and the storage counters behind the handle.
 */
auto SerializePathDiagnostics(PathBuffer const& path, int indent = -1) -> Expected<std::string>;

} // namespace SC
