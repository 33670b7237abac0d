#pragma once

#include <cstdint>

#include "Base.hpp"

// Tracy integration - only enabled in Release builds with TRACY_ENABLE
#if defined(MORPH_BUILD_RELEASE) && defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define MORPH_PROFILE_ENABLED 1

    #define MORPH_PROFILE_ZONE_COLOR(color) ZoneScopedC(color)

    #define MORPH_PROFILE_MESSAGE(text, size) TracyMessage(text, size)
#else
    #define MORPH_PROFILE_ENABLED 0

    #define MORPH_PROFILE_ZONE_COLOR(color)

    #define MORPH_PROFILE_MESSAGE(text, size)
#endif

namespace Morph::Profile
{
    constexpr std::uint32_t ColorEntity = 0x88FF00;
    constexpr std::uint32_t ColorComponent = 0x0088FF;
    constexpr std::uint32_t ColorTransmute = 0xFF8800;
}
