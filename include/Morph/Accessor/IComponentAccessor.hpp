#pragma once

#include <string_view>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "../Entity/Entity.hpp"

namespace Morph
{
    /**
    * Type-erased view of a ComponentAccessor, for code that only knows a
    * ComponentID at runtime.
    *
    * Bool results report whether the entity owns the component once the call
    * returns.
    */
    class IComponentAccessor
    {
    public:
        using IDType = Entity::IDType;

        virtual ~IComponentAccessor() = default;

        MORPH_NODISCARD virtual bool Has(IDType id) const noexcept = 0;
        virtual Result<void> Remove(IDType id) = 0;
        virtual Result<bool> SetPresence(IDType id, bool present) = 0;

        // UnsupportedOperation for component types that are not Mergeable,
        // whatever the entities involved
        virtual Result<bool> MirrorPresence(IDType targetId, IDType sourceId) = 0;

        MORPH_NODISCARD virtual bool IsMergeable() const noexcept = 0;
        MORPH_NODISCARD virtual ComponentID GetComponentID() const noexcept = 0;
        MORPH_NODISCARD virtual std::string_view GetComponentName() const noexcept = 0;
    };
}
