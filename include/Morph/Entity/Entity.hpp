#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

#include "../Core/Base.hpp"

namespace Morph
{
    /**
    * Versioned entity handle: 24-bit id in the low bits, 8-bit version above.
    * Component stores are keyed by the id part only.
    */
    class Entity
    {
    public:
        using IDType = std::uint32_t;
        using VersionType = std::uint8_t;

        static constexpr std::size_t ID_BITS = 24;
        static constexpr std::size_t VERSION_SHIFT = ID_BITS;
        static constexpr IDType ID_MASK = (IDType{1} << ID_BITS) - 1;
        static constexpr IDType VERSION_MASK = 0xFF;
        static constexpr IDType INVALID = std::numeric_limits<IDType>::max();

        constexpr Entity() noexcept : m_entity{INVALID} {}
        constexpr explicit Entity(IDType value) noexcept : m_entity{value} {}
        constexpr Entity(IDType id, VersionType version) noexcept
            : m_entity{(static_cast<IDType>(version) << VERSION_SHIFT) | (id & ID_MASK)} {}

        MORPH_NODISCARD constexpr explicit operator bool() const noexcept { return IsValid(); }

        MORPH_NODISCARD constexpr bool operator==(const Entity& other) const noexcept = default;
        MORPH_NODISCARD constexpr bool operator<(const Entity& other) const noexcept { return m_entity < other.m_entity; }

        MORPH_NODISCARD constexpr IDType GetID() const noexcept { return m_entity & ID_MASK; }
        MORPH_NODISCARD constexpr VersionType GetVersion() const noexcept
        {
            return static_cast<VersionType>((m_entity >> VERSION_SHIFT) & VERSION_MASK);
        }
        MORPH_NODISCARD constexpr IDType GetValue() const noexcept { return m_entity; }

        MORPH_NODISCARD constexpr bool IsValid() const noexcept { return m_entity != INVALID; }

        // Version wraps to 0 after 255, the same id may then alias an old handle
        MORPH_NODISCARD constexpr Entity NextVersion() const noexcept
        {
            return Entity(GetID(), static_cast<VersionType>(GetVersion() + 1));
        }

        MORPH_NODISCARD static constexpr Entity Invalid() noexcept { return Entity{INVALID}; }

    private:
        IDType m_entity;
    };
}

namespace std
{
    template<>
    struct hash<Morph::Entity>
    {
        MORPH_NODISCARD std::size_t operator()(const Morph::Entity& entity) const noexcept
        {
            return std::hash<Morph::Entity::IDType>{}(entity.GetValue());
        }
    };
}
