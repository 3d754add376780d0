#include "core/Config.hpp"

#include "log/TaggedLogger.hpp"
#include "utils/Environment.hpp"

#include <algorithm>
#include <string>

namespace SC {

auto GrowthPolicy::slotCapacity(std::size_t depth, Limits const& limits) const noexcept -> std::size_t {
    return std::min(depth + this->overallocSlots, std::max(depth, limits.maxSubscripts));
}

auto GrowthPolicy::byteCapacity(std::size_t bytesNeeded, Limits const& limits) const noexcept -> std::size_t {
    return std::min(bytesNeeded + this->headroomBytes(), std::max(bytesNeeded, limits.maxPathLength));
}

auto PathOptions::sanitized() const noexcept -> PathOptions {
    PathOptions result = *this;
    result.limits.maxSubscripts      = std::min(result.limits.maxSubscripts, kMaxSubscripts);
    result.limits.maxVarnameLength   = std::max<std::size_t>(result.limits.maxVarnameLength, 1);
    result.limits.maxSubscriptLength = std::min(result.limits.maxSubscriptLength, kMaxStringLength);
    result.limits.maxPathLength      = std::min(result.limits.maxPathLength, kMaxStringLength);
    result.growth.overallocSlots     = std::min(result.growth.overallocSlots, kMaxSubscripts);
    return result;
}

auto loadOptionsFromEnvironment() -> PathOptions {
    PathOptions options;
    if (auto overalloc = env_size("SUBSCACHE_OVERALLOC")) {
        options.growth.overallocSlots = *overalloc;
    }
    if (auto sublen = env_size("SUBSCACHE_TYPICAL_SUBLEN")) {
        options.growth.typicalSubscriptLength = *sublen;
    }
    if (auto maxSubs = env_size("SUBSCACHE_MAX_SUBSCRIPTS")) {
        options.limits.maxSubscripts = *maxSubs;
    }
    auto sanitized = options.sanitized();
    sc_log("Options overalloc=" + std::to_string(sanitized.growth.overallocSlots)
               + " typical_sublen=" + std::to_string(sanitized.growth.typicalSubscriptLength)
               + " max_subs=" + std::to_string(sanitized.limits.maxSubscripts),
           "Config", "INFO");
    return sanitized;
}

auto defaultOptions() -> PathOptions const& {
    static PathOptions const options = loadOptionsFromEnvironment();
    return options;
}

} // namespace SC
