#pragma once

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/TypeID.hpp"
#include "Component.hpp"

namespace Morph
{
    /**
    * Table of per-component-type objects, indexed by ComponentID.
    *
    * Holds one object per component type (a pool, an accessor, ...). T must
    * derive from BaseType and expose the component it serves as
    * T::ComponentType.
    *
    * Thread Safety: NOT thread-safe.
    */
    template<typename BaseType>
    class ComponentStorage
    {
    public:
        /**
        * Get or create the object for T::ComponentType.
        * Args are forwarded to T's constructor on first use only.
        * @return Non-null pointer
        */
        template<typename T, typename... Args>
        T* GetOrCreate(Args&&... args)
        {
            static_assert(std::is_base_of_v<BaseType, T>, "Type must derive from BaseType");

            const ComponentID id = TypeID<typename T::ComponentType>::Value();
            if (id >= m_storage.size())
            {
                m_storage.resize(static_cast<std::size_t>(id) + 1);
            }

            if (!m_storage[id])
            {
                m_storage[id] = std::make_unique<T>(std::forward<Args>(args)...);
                ++m_count;
            }

            return static_cast<T*>(m_storage[id].get());
        }

        // nullptr if nothing is registered for T::ComponentType
        template<typename T>
        MORPH_NODISCARD T* Get() const noexcept
        {
            static_assert(std::is_base_of_v<BaseType, T>, "Type must derive from BaseType");

            const ComponentID id = TypeID<typename T::ComponentType>::Value();
            return static_cast<T*>(GetByID(id));
        }

        MORPH_NODISCARD BaseType* GetByID(ComponentID id) const noexcept
        {
            return id < m_storage.size() ? m_storage[id].get() : nullptr;
        }

        MORPH_NODISCARD bool IsRegistered(ComponentID id) const noexcept
        {
            return GetByID(id) != nullptr;
        }

        MORPH_NODISCARD std::size_t Count() const noexcept { return m_count; }

        template<typename Func>
        void ForEach(Func&& func) const
        {
            for (std::size_t id = 0; id < m_storage.size(); ++id)
            {
                if (m_storage[id])
                {
                    func(static_cast<ComponentID>(id), m_storage[id].get());
                }
            }
        }

    private:
        std::vector<std::unique_ptr<BaseType>> m_storage;
        std::size_t m_count = 0;
    };
}
