#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../Accessor/IComponentAccessor.hpp"
#include "../Component/Component.hpp"
#include "../Component/ComponentPool.hpp"
#include "../Component/ComponentStorage.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Entity/Entity.hpp"
#include "../Entity/EntityIDStack.hpp"
#include "CompositionTable.hpp"
#include "Flyweight.hpp"

namespace Morph
{
    class Transmuter;

    /**
    * Owns entity ids, their compositions and one component pool per type.
    *
    * Every pool covers the same id range, [0, GetCapacity()). The range only
    * grows, as entities are created.
    *
    * Thread Safety: NOT thread-safe. A world, its pools and its accessors
    * belong to one thread at a time.
    */
    class World
    {
    public:
        using IDType = Entity::IDType;

        struct Config
        {
            IDType initialCapacity = config::DEFAULT_ENTITY_CAPACITY;
        };

        struct Stats
        {
            // Structural changes applied (composition actually changed)
            std::uint64_t transmutations = 0;
            std::size_t compositions = 1;
            std::size_t aliveEntities = 0;
        };

        World() : World(Config{}) {}

        explicit World(const Config& config)
        {
            Grow(std::min<IDType>(config.initialCapacity, EntityIDStack::INVALID_ID));
        }

        World(const World&) = delete;
        World& operator=(const World&) = delete;

        Entity CreateEntity()
        {
            MORPH_PROFILE_ZONE_COLOR(Profile::ColorEntity);

            const auto [id, version] = m_ids.Allocate();
            if (id == EntityIDStack::INVALID_ID) MORPH_UNLIKELY
            {
                Log::Error("World", "entity id space exhausted");
                return Entity::Invalid();
            }

            if (id >= m_capacity)
            {
                const std::size_t doubled = static_cast<std::size_t>(m_capacity) * config::CAPACITY_GROWTH_FACTOR;
                const std::size_t wanted = std::max<std::size_t>(doubled, static_cast<std::size_t>(id) + 1);
                Grow(static_cast<IDType>(std::min<std::size_t>(wanted, EntityIDStack::INVALID_ID)));
            }

            EntityRecord& record = m_records[id];
            record.version = version;
            record.composition = CompositionTable::EMPTY;
            record.alive = true;
            ++m_stats.aliveEntities;

            return Entity(id, version);
        }

        /**
        * Removes every component the entity owns, then releases its id.
        * Stale handles (wrong version) are rejected with InvalidEntity.
        */
        Result<void> DestroyEntity(Entity entity)
        {
            MORPH_PROFILE_ZONE_COLOR(Profile::ColorEntity);

            const IDType id = entity.GetID();
            if (!IsValidID(id))
            {
                return Err(MakeError(ErrorCode::OutOfBounds));
            }
            if (!IsAlive(entity))
            {
                return Err(MakeError(ErrorCode::InvalidEntity));
            }

            EntityRecord& record = m_records[id];
            if (record.composition != CompositionTable::EMPTY)
            {
                m_compositions.GetMask(record.composition).ForEachSetBit([this, id](std::size_t componentId)
                {
                    IComponentPool* pool = m_pools.GetByID(static_cast<ComponentID>(componentId));
                    MORPH_ASSERT(pool != nullptr, "Composition references an unregistered component");
                    pool->Erase(id);
                });
                record.composition = CompositionTable::EMPTY;
                ++m_stats.transmutations;
            }

            record.alive = false;
            --m_stats.aliveEntities;
            m_ids.Recycle(id, static_cast<Entity::VersionType>(record.version + 1));
            return {};
        }

        MORPH_NODISCARD bool IsAlive(Entity entity) const noexcept
        {
            const IDType id = entity.GetID();
            return entity.IsValid() && IsAlive(id) && m_records[id].version == entity.GetVersion();
        }

        // Version-agnostic, for flyweights that only carry an id
        MORPH_NODISCARD bool IsAlive(IDType id) const noexcept
        {
            return IsValidID(id) && m_records[id].alive;
        }

        MORPH_NODISCARD bool IsValidID(IDType id) const noexcept { return id < m_capacity; }
        MORPH_NODISCARD IDType GetCapacity() const noexcept { return m_capacity; }
        MORPH_NODISCARD std::size_t Size() const noexcept { return m_stats.aliveEntities; }

        /**
        * The pool for T, created on first request and sized to the current range.
        */
        template<Component T>
        ComponentPool<T>& GetPool()
        {
            if (auto* pool = m_pools.Get<ComponentPool<T>>())
            {
                return *pool;
            }

            auto* pool = m_pools.GetOrCreate<ComponentPool<T>>(m_capacity);
            if (Log::IsEnabled(LogLevel::Debug))
            {
                Log::Debug("World", "pool created for " + std::string(TypeName_v<T>)
                    + " (component id " + std::to_string(pool->GetComponentID()) + ")");
            }
            return *pool;
        }

        MORPH_NODISCARD IComponentPool* GetPoolByID(ComponentID id) const noexcept
        {
            return m_pools.GetByID(id);
        }

        // EMPTY for ids outside the range or not alive
        MORPH_NODISCARD CompositionID GetComposition(IDType id) const noexcept
        {
            return IsAlive(id) ? m_records[id].composition : CompositionTable::EMPTY;
        }

        MORPH_NODISCARD const ComponentMask& GetMask(CompositionID composition) const noexcept
        {
            return m_compositions.GetMask(composition);
        }

        MORPH_NODISCARD Flyweight CreateFlyweight() noexcept
        {
            return Flyweight(this);
        }

        // Accessor registered for a component id, nullptr if none was requested yet
        MORPH_NODISCARD IComponentAccessor* GetAccessor(ComponentID id) const noexcept
        {
            return m_accessors.GetByID(id);
        }

        MORPH_NODISCARD ComponentStorage<IComponentAccessor>& GetAccessorStorage() noexcept
        {
            return m_accessors;
        }

        MORPH_NODISCARD Stats GetStats() const noexcept
        {
            Stats stats = m_stats;
            stats.compositions = m_compositions.Size();
            return stats;
        }

    private:
        friend class Transmuter;

        struct EntityRecord
        {
            CompositionID composition = CompositionTable::EMPTY;
            Entity::VersionType version = 0;
            bool alive = false;
        };

        CompositionID InternComposition(const ComponentMask& mask)
        {
            return m_compositions.GetOrCreate(mask);
        }

        void SetComposition(IDType id, CompositionID composition) noexcept
        {
            m_records[id].composition = composition;
            ++m_stats.transmutations;
        }

        void Grow(IDType capacity)
        {
            if (capacity <= m_capacity)
                return;

            m_records.resize(capacity);
            m_pools.ForEach([capacity](ComponentID, IComponentPool* pool)
            {
                pool->EnsureCapacity(capacity);
            });
            m_capacity = capacity;
        }

        EntityIDStack m_ids;
        std::vector<EntityRecord> m_records;
        CompositionTable m_compositions;
        ComponentStorage<IComponentPool> m_pools;
        // Declared after m_pools: accessors reference pools and must go first
        ComponentStorage<IComponentAccessor> m_accessors;
        IDType m_capacity = 0;
        Stats m_stats;
    };
}
