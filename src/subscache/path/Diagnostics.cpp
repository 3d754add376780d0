#include "path/Diagnostics.hpp"

#include "path/PathBuffer.hpp"
#include "path/Render.hpp"

#include <nlohmann/json.hpp>

namespace SC {
namespace {

[[nodiscard]] auto stats_json(PathBuffer::Stats const& stats) -> nlohmann::json {
    return nlohmann::json{
        {"depth", stats.depth},
        {"depth_used", stats.depthUsed},
        {"depth_alloc", stats.depthAlloc},
        {"byte_capacity", stats.byteCapacity},
        {"bytes_used", stats.bytesUsed},
        {"use_count", stats.useCount},
        {"mutable", stats.flags.isMutable},
        {"view", stats.flags.isView},
    };
}

} // namespace

auto SerializePathDiagnostics(PathBuffer const& path, int indent) -> Expected<std::string> {
    auto stats = path.stats();
    if (!stats) {
        return std::unexpected(stats.error());
    }
    auto key = to_string(path);
    if (!key) {
        return std::unexpected(key.error());
    }
    auto subscripts = path.subscripts();
    if (!subscripts) {
        return std::unexpected(subscripts.error());
    }

    nlohmann::json rendered = nlohmann::json::array();
    for (auto const& subscript : *subscripts) {
        rendered.push_back(render_subscript(subscript));
    }

    nlohmann::json json{
        {"key", *key},
        {"varname", std::string{path.varname()}},
        {"subscripts", std::move(rendered)},
        {"storage", stats_json(*stats)},
    };
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace SC
