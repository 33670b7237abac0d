#pragma once

#include "../Core/Base.hpp"
#include "../Entity/Entity.hpp"
#include "../Entity/EntityIDStack.hpp"

namespace Morph
{
    class World;

    /**
    * Placeholder entity handle: a bare (id, world) pair that stands in for an
    * entity during a structural mutation, so no entity has to be resolved or
    * allocated for it. Freshly created ids may not be resolvable yet, a
    * flyweight still is.
    *
    * The owner rewrites id before every use and must not read it after the
    * call that used it returns. A flyweight is not reentrant: arming it while
    * an earlier mutation through it is still running corrupts that mutation.
    */
    struct Flyweight
    {
        using IDType = Entity::IDType;

        IDType id = EntityIDStack::INVALID_ID;
        World* world = nullptr;

        Flyweight() = default;
        explicit Flyweight(World* owner) noexcept : world(owner) {}

        Flyweight& Arm(IDType entityId) noexcept
        {
#ifdef MORPH_BUILD_DEBUG
            MORPH_ASSERT(!m_armed, "Flyweight re-armed while a mutation through it is in flight");
            m_armed = true;
#endif
            id = entityId;
            return *this;
        }

        void Disarm() noexcept
        {
#ifdef MORPH_BUILD_DEBUG
            m_armed = false;
#endif
        }

    private:
#ifdef MORPH_BUILD_DEBUG
        bool m_armed = false;
#endif
    };

    /**
    * Arms a flyweight for the lifetime of the scope, disarming it on exit
    * including when a mutation throws.
    */
    class ArmedFlyweight
    {
    public:
        ArmedFlyweight(Flyweight& flyweight, Flyweight::IDType entityId) noexcept
            : m_flyweight(flyweight.Arm(entityId))
        {}

        ~ArmedFlyweight() { m_flyweight.Disarm(); }

        ArmedFlyweight(const ArmedFlyweight&) = delete;
        ArmedFlyweight& operator=(const ArmedFlyweight&) = delete;

        MORPH_NODISCARD const Flyweight& Get() const noexcept { return m_flyweight; }

    private:
        Flyweight& m_flyweight;
    };
}
