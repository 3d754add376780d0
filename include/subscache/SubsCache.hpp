#pragma once

#include "core/Config.hpp"
#include "core/Error.hpp"
#include "path/Diagnostics.hpp"
#include "path/KeyArgs.hpp"
#include "path/MutableCursor.hpp"
#include "path/Numeric.hpp"
#include "path/PathBuffer.hpp"
#include "path/Render.hpp"
#include "path/ScratchArena.hpp"
#include "path/Subscript.hpp"
