#pragma once

#include <concepts>
#include <cstddef>
#include <type_traits>

#include "../Container/Bitmap.hpp"
#include "../Core/Config.hpp"
#include "../Core/TypeID.hpp"

namespace Morph
{
    constexpr std::size_t MAX_COMPONENTS = config::MAX_COMPONENTS;

    // Set of component types owned by an entity
    using ComponentMask = Bitmap<MAX_COMPONENTS>;

    // Structural mutations construct components in place, so a default state is required
    template<typename T>
    concept Component = std::is_object_v<T> &&
                        !std::is_const_v<T> &&
                        std::is_default_constructible_v<T> &&
                        std::is_nothrow_destructible_v<T>;

    /**
    * Component types whose state can be copied or merged from another instance
    * of the same type. What AssignFrom copies is defined by the component.
    *
    *   struct Tint
    *   {
    *       float r, g, b;
    *       Tint& AssignFrom(const Tint& other) { r = other.r; g = other.g; b = other.b; return *this; }
    *   };
    */
    template<typename T>
    concept Mergeable = Component<T> && requires(T& target, const T& source)
    {
        { target.AssignFrom(source) } -> std::same_as<T&>;
    };

    template<Component T>
    MORPH_NODISCARD ComponentID ComponentIDOf() noexcept
    {
        return TypeID<T>::Value();
    }
}
