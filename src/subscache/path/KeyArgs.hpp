#pragma once
#include "core/Config.hpp"

#include <array>
#include <string_view>

namespace SC {

// Layout of the engine's string descriptor.
struct EngineBuffer {
    unsigned int len_alloc = 0;
    unsigned int len_used  = 0;
    char const*  buf_addr  = nullptr;

    [[nodiscard]] auto view() const noexcept -> std::string_view {
        return {buf_addr, len_used};
    }
};

/**
 * Varname and subscript array in the engine's calling convention. The
 * buffers point into a path's arena: they stay valid while that path is
 * alive and until its final subscript is substituted.
 */
struct KeyArgs {
    EngineBuffer                              varname;
    int                                       subs_used = 0;
    std::array<EngineBuffer, kMaxSubscripts>  subsarray{};
};

} // namespace SC
