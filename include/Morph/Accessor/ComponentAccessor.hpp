#pragma once

#include <string>
#include <string_view>

#include "../Component/Component.hpp"
#include "../Component/ComponentPool.hpp"
#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Entity/Entity.hpp"
#include "../World/Flyweight.hpp"
#include "../World/Transmuter.hpp"
#include "../World/World.hpp"
#include "IComponentAccessor.hpp"

namespace Morph
{
    /**
    * Lifecycle accessor for one component type.
    *
    * Reads go straight to the pool. Creating and removing the component goes
    * through two transmuters built once at construction (add T, remove T), and
    * both are idempotent: the mutation runs only when the entity's state has to
    * change, so one structural change per actual transition.
    *
    * Every mutation passes the entity to the transmuter through a single owned
    * flyweight instead of resolving an entity object. That makes an accessor
    * non-reentrant: confine it, like its world, to one thread.
    *
    * The world must outlive the accessor. Use AccessorFor<T>(world) for the
    * world's shared instance.
    */
    template<Component T>
    class ComponentAccessor final : public IComponentAccessor
    {
    public:
        using ComponentType = T;
        using IDType = Entity::IDType;

        static constexpr bool MERGEABLE = Mergeable<T>;

        explicit ComponentAccessor(World& world)
            : m_pool(&world.GetPool<T>())
            , m_createTransmuter(TransmuterFactory(world).Add<T>().Build())
            , m_removeTransmuter(TransmuterFactory(world).Remove<T>().Build())
            , m_flyweight(world.CreateFlyweight())
        {
            if (Log::IsEnabled(LogLevel::Debug))
            {
                Log::Debug("Accessor", "accessor built for " + std::string(TypeName_v<T>)
                    + (MERGEABLE ? " (mergeable)" : ""));
            }
        }

        ComponentAccessor(const ComponentAccessor&) = delete;
        ComponentAccessor& operator=(const ComponentAccessor&) = delete;

        /**
        * Bounds-checked fetch.
        * @return OutOfBounds when id is outside the allocated range,
        *         ComponentNotFound when the entity does not have T
        */
        MORPH_NODISCARD Result<T*> Get(IDType id) noexcept
        {
            return m_pool->Get(id);
        }

        MORPH_NODISCARD Result<T*> Get(Entity entity) noexcept
        {
            return Get(entity.GetID());
        }

        MORPH_NODISCARD bool Has(IDType id) const noexcept override
        {
            return m_pool->Contains(id);
        }

        MORPH_NODISCARD bool Has(Entity entity) const noexcept
        {
            return Has(entity.GetID());
        }

        // nullptr when the entity does not have T
        MORPH_NODISCARD T* GetSafe(IDType id) noexcept
        {
            return m_pool->TryGet(id);
        }

        MORPH_NODISCARD T* GetSafe(Entity entity) noexcept
        {
            return GetSafe(entity.GetID());
        }

        /**
        * @param fallback Returned when the entity does not have T, may be nullptr
        */
        MORPH_NODISCARD T* GetSafe(IDType id, T* fallback) noexcept
        {
            T* component = m_pool->TryGet(id);
            return component ? component : fallback;
        }

        MORPH_NODISCARD T* GetSafe(Entity entity, T* fallback) noexcept
        {
            return GetSafe(entity.GetID(), fallback);
        }

        /**
        * Create T on the entity unless it already has one.
        * @return The existing or newly default-constructed component
        */
        Result<T*> Create(IDType id)
        {
            MORPH_PROFILE_ZONE_COLOR(Profile::ColorComponent);

            if (T* existing = m_pool->TryGet(id))
            {
                return existing;
            }

            if (auto result = TransmuteAs(m_createTransmuter, id); result.IsErr())
            {
                return Err(result.Error());
            }
            return m_pool->Get(id);
        }

        Result<T*> Create(Entity entity)
        {
            return Create(entity.GetID());
        }

        // No-op when the entity does not have T
        Result<void> Remove(IDType id) override
        {
            MORPH_PROFILE_ZONE_COLOR(Profile::ColorComponent);

            if (!Has(id))
            {
                return {};
            }
            return TransmuteAs(m_removeTransmuter, id);
        }

        Result<void> Remove(Entity entity)
        {
            return Remove(entity.GetID());
        }

        /**
        * Create (present = true) or remove (present = false) T.
        * @return The component, or nullptr after removal
        */
        Result<T*> Set(IDType id, bool present)
        {
            if (present)
            {
                return Create(id);
            }

            if (auto result = Remove(id); result.IsErr())
            {
                return Err(result.Error());
            }
            return static_cast<T*>(nullptr);
        }

        Result<T*> Set(Entity entity, bool present)
        {
            return Set(entity.GetID(), present);
        }

        /**
        * Make the target's T track the source's, once.
        *
        * Source has T: the target gets one if it lacks it, then
        * target.AssignFrom(source). Source lacks T: the target loses its T.
        * @return The target's component, or nullptr when the source has none
        */
        Result<T*> Mirror(IDType targetId, IDType sourceId) requires Mergeable<T>
        {
            MORPH_PROFILE_ZONE_COLOR(Profile::ColorComponent);

            const T* source = m_pool->TryGet(sourceId);
            if (!source)
            {
                if (auto result = Remove(targetId); result.IsErr())
                {
                    return Err(result.Error());
                }
                return static_cast<T*>(nullptr);
            }

            // Create never grows the id range and pages never move, so source
            // stays valid across it
            auto target = Create(targetId);
            if (target.IsErr())
            {
                return target;
            }
            if (target.Value() != source)
            {
                target.Value()->AssignFrom(*source);
            }
            return target;
        }

        Result<T*> Mirror(Entity target, Entity source) requires Mergeable<T>
        {
            return Mirror(target.GetID(), source.GetID());
        }

        MORPH_NODISCARD ComponentPool<T>& GetPool() noexcept { return *m_pool; }
        MORPH_NODISCARD const Transmuter& GetCreateTransmuter() const noexcept { return m_createTransmuter; }
        MORPH_NODISCARD const Transmuter& GetRemoveTransmuter() const noexcept { return m_removeTransmuter; }

        // IComponentAccessor
        Result<bool> SetPresence(IDType id, bool present) override
        {
            auto result = Set(id, present);
            if (result.IsErr())
            {
                return Err(result.Error());
            }
            return result.Value() != nullptr;
        }

        Result<bool> MirrorPresence(IDType targetId, IDType sourceId) override
        {
            if constexpr (MERGEABLE)
            {
                auto result = Mirror(targetId, sourceId);
                if (result.IsErr())
                {
                    return Err(result.Error());
                }
                return result.Value() != nullptr;
            }
            else
            {
                Log::Error("Accessor", std::string(TypeName_v<T>) + " has no AssignFrom, it cannot be mirrored");
                return Err(MakeError(ErrorCode::UnsupportedOperation));
            }
        }

        MORPH_NODISCARD bool IsMergeable() const noexcept override { return MERGEABLE; }
        MORPH_NODISCARD ComponentID GetComponentID() const noexcept override { return m_pool->GetComponentID(); }
        MORPH_NODISCARD std::string_view GetComponentName() const noexcept override { return TypeName_v<T>; }

    private:
        Result<void> TransmuteAs(const Transmuter& transmuter, IDType id)
        {
            auto result = [&]
            {
                const ArmedFlyweight armed(m_flyweight, id);
                return transmuter.Transmute(armed.Get());
            }();

            if (result.IsErr() && Log::IsEnabled(LogLevel::Warn))
            {
                Log::Warn("Accessor", std::string(TypeName_v<T>) + ": mutation of entity "
                    + std::to_string(id) + " rejected: " + result.Error().message);
            }
            return result;
        }

        ComponentPool<T>* m_pool;
        Transmuter m_createTransmuter;
        Transmuter m_removeTransmuter;
        Flyweight m_flyweight;
    };

    /**
    * The world's shared accessor for T, built on first request.
    */
    template<Component T>
    MORPH_NODISCARD ComponentAccessor<T>& AccessorFor(World& world)
    {
        return *world.GetAccessorStorage().GetOrCreate<ComponentAccessor<T>>(world);
    }
}
