#pragma once

#define MORPH_VERSION_MAJOR 0
#define MORPH_VERSION_MINOR 3
#define MORPH_VERSION_PATCH 0

#define MORPH_VERSION ((MORPH_VERSION_MAJOR << 16) | (MORPH_VERSION_MINOR << 8) | MORPH_VERSION_PATCH)

namespace Morph
{
    inline constexpr int VERSION_MAJOR = MORPH_VERSION_MAJOR;
    inline constexpr int VERSION_MINOR = MORPH_VERSION_MINOR;
    inline constexpr int VERSION_PATCH = MORPH_VERSION_PATCH;
    inline constexpr int VERSION = MORPH_VERSION;
}
