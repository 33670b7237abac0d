#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"
#include "Component.hpp"

namespace Morph
{
    class Transmuter;
    class World;

    /**
    * Type-erased interface for component pools.
    *
    * Reads are public. Inserting and erasing components is reserved to
    * Transmuter so that an entity's composition and its pools never disagree,
    * and growing the id range is reserved to World.
    */
    class IComponentPool
    {
    public:
        using IDType = Entity::IDType;

        virtual ~IComponentPool() = default;

        MORPH_NODISCARD virtual bool Contains(IDType id) const noexcept = 0;
        MORPH_NODISCARD virtual std::size_t Size() const noexcept = 0;
        MORPH_NODISCARD virtual IDType Capacity() const noexcept = 0;

        MORPH_NODISCARD virtual ComponentID GetComponentID() const noexcept = 0;
        MORPH_NODISCARD virtual std::string_view GetComponentName() const noexcept = 0;

    protected:
        friend class Transmuter;
        friend class World;

        // Returns false if the slot was already occupied
        virtual bool EmplaceDefault(IDType id) = 0;
        virtual bool Erase(IDType id) noexcept = 0;
        virtual void EnsureCapacity(IDType capacity) = 0;
    };

    /**
    * Paged id -> component storage for one component type.
    *
    * Pages hold POOL_PAGE_SIZE slots and are allocated on first insert, so a
    * component's address is stable from creation until removal. Lookups outside
    * [0, Capacity()) are reported, never performed.
    */
    template<Component T>
    class ComponentPool final : public IComponentPool
    {
    public:
        using ComponentType = T;

        explicit ComponentPool(IDType capacity = 0)
            : m_componentId(TypeID<T>::Value())
        {
            EnsureCapacity(capacity);
        }

        ComponentPool(const ComponentPool&) = delete;
        ComponentPool& operator=(const ComponentPool&) = delete;

        /**
        * Bounds-checked fetch.
        * @return The component, OutOfBounds if id is outside the allocated range,
        *         ComponentNotFound if the entity does not have one
        */
        MORPH_NODISCARD Result<T*> Get(IDType id) noexcept
        {
            if (id >= m_capacity) MORPH_UNLIKELY
            {
                return Err(MakeError(ErrorCode::OutOfBounds));
            }

            T* component = Lookup(id);
            if (!component)
            {
                return Err(MakeError(ErrorCode::ComponentNotFound));
            }
            return component;
        }

        MORPH_NODISCARD Result<const T*> Get(IDType id) const noexcept
        {
            if (id >= m_capacity) MORPH_UNLIKELY
            {
                return Err(MakeError(ErrorCode::OutOfBounds));
            }

            const T* component = Lookup(id);
            if (!component)
            {
                return Err(MakeError(ErrorCode::ComponentNotFound));
            }
            return component;
        }

        // nullptr when absent or out of range
        MORPH_NODISCARD T* TryGet(IDType id) noexcept
        {
            return id < m_capacity ? Lookup(id) : nullptr;
        }

        MORPH_NODISCARD const T* TryGet(IDType id) const noexcept
        {
            return id < m_capacity ? Lookup(id) : nullptr;
        }

        MORPH_NODISCARD bool Contains(IDType id) const noexcept override
        {
            return TryGet(id) != nullptr;
        }

        MORPH_NODISCARD std::size_t Size() const noexcept override { return m_size; }
        MORPH_NODISCARD bool Empty() const noexcept { return m_size == 0; }
        MORPH_NODISCARD IDType Capacity() const noexcept override { return m_capacity; }

        // Pages actually backing components, for memory diagnostics
        MORPH_NODISCARD std::size_t GetAllocatedPageCount() const noexcept
        {
            std::size_t count = 0;
            for (const auto& page : m_pages)
            {
                if (page) ++count;
            }
            return count;
        }

        MORPH_NODISCARD ComponentID GetComponentID() const noexcept override { return m_componentId; }
        MORPH_NODISCARD std::string_view GetComponentName() const noexcept override { return TypeName_v<T>; }

    protected:
        bool EmplaceDefault(IDType id) override
        {
            MORPH_PROFILE_ZONE_COLOR(Profile::ColorComponent);
            MORPH_ASSERT(id < m_capacity, "Emplace outside the allocated range");

            auto& page = m_pages[PageIndex(id)];
            if (!page)
            {
                page = std::make_unique<Page>();
            }

            auto& slot = (*page)[SlotIndex(id)];
            if (slot.has_value())
            {
                return false;
            }

            slot.emplace();
            ++m_size;
            return true;
        }

        bool Erase(IDType id) noexcept override
        {
            MORPH_PROFILE_ZONE_COLOR(Profile::ColorComponent);
            if (id >= m_capacity)
                return false;

            auto& page = m_pages[PageIndex(id)];
            if (!page || !(*page)[SlotIndex(id)].has_value())
                return false;

            (*page)[SlotIndex(id)].reset();
            --m_size;
            return true;
        }

        void EnsureCapacity(IDType capacity) override
        {
            if (capacity <= m_capacity)
                return;

            m_pages.resize((static_cast<std::size_t>(capacity) + config::POOL_PAGE_SIZE - 1) / config::POOL_PAGE_SIZE);
            m_capacity = capacity;
        }

    private:
        using Page = std::array<std::optional<T>, config::POOL_PAGE_SIZE>;

        static constexpr std::size_t PageIndex(IDType id) noexcept { return id / config::POOL_PAGE_SIZE; }
        static constexpr std::size_t SlotIndex(IDType id) noexcept { return id & (config::POOL_PAGE_SIZE - 1); }

        T* Lookup(IDType id) noexcept
        {
            auto& page = m_pages[PageIndex(id)];
            if (!page) return nullptr;
            auto& slot = (*page)[SlotIndex(id)];
            return slot.has_value() ? &*slot : nullptr;
        }

        const T* Lookup(IDType id) const noexcept
        {
            const auto& page = m_pages[PageIndex(id)];
            if (!page) return nullptr;
            const auto& slot = (*page)[SlotIndex(id)];
            return slot.has_value() ? &*slot : nullptr;
        }

        std::vector<std::unique_ptr<Page>> m_pages;
        std::size_t m_size = 0;
        IDType m_capacity = 0;
        ComponentID m_componentId;
    };
}
