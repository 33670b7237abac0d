#pragma once

#include "../Platform/Platform.hpp"

#define MORPH_NODISCARD [[nodiscard]]
#define MORPH_LIKELY [[likely]]
#define MORPH_UNLIKELY [[unlikely]]

// Runtime assertion macro
// Define MORPH_BUILD_DEBUG in the build system for debug builds
#ifdef MORPH_BUILD_DEBUG
    #include <cassert>
    #define MORPH_ASSERT(condition, message) assert((condition) && (message))
#else
    #define MORPH_ASSERT(condition, message) ((void)0)
#endif
