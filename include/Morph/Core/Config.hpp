#pragma once

#include <cstddef>
#include <cstdint>

#include "Base.hpp"

namespace Morph
{
    // Allow users to override the maximum number of component types
    // Usage: #define MORPH_MAX_COMPONENTS 128 before including Morph
    #ifndef MORPH_MAX_COMPONENTS
        #define MORPH_MAX_COMPONENTS 64u
    #endif

    namespace config
    {
        inline constexpr std::size_t MAX_COMPONENTS = MORPH_MAX_COMPONENTS;

        // Slots per component pool page. Pages are never reallocated, so a
        // component keeps its address until it is removed.
        inline constexpr std::size_t POOL_PAGE_SIZE = 1024;

        // Id range every pool covers before the first entity is created.
        inline constexpr std::uint32_t DEFAULT_ENTITY_CAPACITY = 128;

        inline constexpr std::size_t CAPACITY_GROWTH_FACTOR = 2;
    }

    template<typename T>
    inline constexpr bool IsPowerOfTwo(T value) noexcept
    {
        return value && !(value & (value - 1));
    }

    static_assert(IsPowerOfTwo(config::POOL_PAGE_SIZE), "Pool page size must be a power of two");
}
