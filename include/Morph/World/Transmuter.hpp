#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../Component/Component.hpp"
#include "../Component/ComponentPool.hpp"
#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "Flyweight.hpp"
#include "World.hpp"

namespace Morph
{
    /**
    * Precompiled structural mutation: "add these component types, remove those".
    *
    * Built once by TransmuterFactory and applied many times. Applying it to an
    * entity moves the entity to the composition (current | additions) - removals,
    * default-constructing added components and destroying removed ones.
    *
    * The add/remove sets never change after construction. Resolved transitions
    * are cached per source composition, the same way an archetype graph caches
    * its edges; the cache has no observable effect.
    */
    class Transmuter
    {
    public:
        using IDType = Entity::IDType;

        Transmuter(const Transmuter&) = delete;
        Transmuter& operator=(const Transmuter&) = delete;
        Transmuter(Transmuter&&) noexcept = default;
        Transmuter& operator=(Transmuter&&) noexcept = default;

        /**
        * Apply to the entity the flyweight currently points at.
        * @return OutOfBounds if the id is outside the world's range,
        *         InvalidEntity if it is not alive,
        *         CapacityExceeded if the program names a component id beyond MORPH_MAX_COMPONENTS
        */
        Result<void> Transmute(const Flyweight& entity) const
        {
            MORPH_PROFILE_ZONE_COLOR(Profile::ColorTransmute);
            MORPH_ASSERT(entity.world == m_world, "Flyweight belongs to another world");

            if (!m_valid) MORPH_UNLIKELY
            {
                return Err(MakeError(ErrorCode::CapacityExceeded));
            }

            const IDType id = entity.id;
            if (!m_world->IsValidID(id))
            {
                return Err(MakeError(ErrorCode::OutOfBounds));
            }
            if (!m_world->IsAlive(id))
            {
                return Err(MakeError(ErrorCode::InvalidEntity));
            }

            const CompositionID from = m_world->GetComposition(id);
            const Transition& transition = Resolve(from);
            if (transition.target == from)
            {
                return {};
            }

            // Additions can throw (allocation, component constructor), so they
            // go first and are undone on failure. Erase never throws.
            std::size_t added = 0;
            try
            {
                for (; added < transition.added.size(); ++added)
                {
                    transition.added[added]->EmplaceDefault(id);
                }
            }
            catch (...)
            {
                for (std::size_t i = 0; i < added; ++i)
                {
                    transition.added[i]->Erase(id);
                }
                throw;
            }

            for (IComponentPool* pool : transition.removed)
            {
                pool->Erase(id);
            }

            m_world->SetComposition(id, transition.target);
            return {};
        }

        MORPH_NODISCARD const ComponentMask& GetAdditions() const noexcept { return m_additions; }
        MORPH_NODISCARD const ComponentMask& GetRemovals() const noexcept { return m_removals; }

        MORPH_NODISCARD std::size_t GetCachedTransitionCount() const noexcept
        {
            std::size_t count = 0;
            for (const auto& transition : m_transitions)
            {
                if (transition) ++count;
            }
            return count;
        }

    private:
        friend class TransmuterFactory;

        struct Transition
        {
            CompositionID target = CompositionTable::EMPTY;
            std::vector<IComponentPool*> added;
            std::vector<IComponentPool*> removed;
        };

        Transmuter(World& world, const ComponentMask& additions, const ComponentMask& removals, bool valid)
            : m_world(&world)
            , m_additions(additions)
            , m_removals(removals)
            , m_valid(valid)
        {}

        const Transition& Resolve(CompositionID from) const
        {
            if (from >= m_transitions.size())
            {
                m_transitions.resize(static_cast<std::size_t>(from) + 1);
            }

            std::optional<Transition>& cached = m_transitions[from];
            if (!cached)
            {
                // By value: interning the target below may grow the composition table
                const ComponentMask current = m_world->GetMask(from);
                const ComponentMask next = (current | m_additions).Without(m_removals);

                Transition transition;
                transition.target = m_world->InternComposition(next);
                next.Without(current).ForEachSetBit([&](std::size_t componentId)
                {
                    transition.added.push_back(m_world->GetPoolByID(static_cast<ComponentID>(componentId)));
                });
                current.Without(next).ForEachSetBit([&](std::size_t componentId)
                {
                    transition.removed.push_back(m_world->GetPoolByID(static_cast<ComponentID>(componentId)));
                });
                cached = std::move(transition);
            }
            return *cached;
        }

        World* m_world;
        ComponentMask m_additions;
        ComponentMask m_removals;
        bool m_valid;
        // Indexed by source CompositionID
        mutable std::vector<std::optional<Transition>> m_transitions;
    };

    /**
    * Builder for Transmuter. Registers the pools of every named component type
    * with the world up front, so applying the result never creates pools.
    *
    *   Transmuter grow = TransmuterFactory(world).Add<Position>().Remove<Frozen>().Build();
    *   grow.Transmute(flyweight.Arm(id));
    */
    class TransmuterFactory
    {
    public:
        explicit TransmuterFactory(World& world) noexcept
            : m_world(&world)
        {}

        template<Component T>
        TransmuterFactory& Add()
        {
            const ComponentID id = Register<T>();
            m_additions.Set(id);
            m_removals.Reset(id);
            return *this;
        }

        template<Component T>
        TransmuterFactory& Remove()
        {
            const ComponentID id = Register<T>();
            m_removals.Set(id);
            m_additions.Reset(id);
            return *this;
        }

        MORPH_NODISCARD Transmuter Build() const
        {
            return Transmuter(*m_world, m_additions, m_removals, m_valid);
        }

    private:
        template<Component T>
        ComponentID Register()
        {
            const ComponentID id = m_world->GetPool<T>().GetComponentID();
            if (id >= MAX_COMPONENTS) MORPH_UNLIKELY
            {
                Log::Error("Transmuter", "component " + std::string(TypeName_v<T>)
                    + " exceeds MORPH_MAX_COMPONENTS (" + std::to_string(MAX_COMPONENTS) + ")");
                m_valid = false;
            }
            return id;
        }

        World* m_world;
        ComponentMask m_additions;
        ComponentMask m_removals;
        bool m_valid = true;
    };
}
