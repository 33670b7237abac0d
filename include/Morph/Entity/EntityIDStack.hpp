#pragma once

#include <cstddef>
#include <vector>

#include "../Core/Base.hpp"
#include "Entity.hpp"

namespace Morph
{
    /**
    * Hands out entity ids, lowest fresh id first, reusing released ids (LIFO)
    * with the version they should carry next.
    */
    class EntityIDStack
    {
    public:
        using IDType = Entity::IDType;
        using VersionType = Entity::VersionType;

        static constexpr IDType INVALID_ID = Entity::ID_MASK;
        static constexpr VersionType INITIAL_VERSION = 1;

        struct VersionedID
        {
            IDType id;
            VersionType version;

            MORPH_NODISCARD bool IsValid() const noexcept { return id != INVALID_ID; }
        };

        MORPH_NODISCARD VersionedID Allocate() noexcept
        {
            if (!m_recycledIDs.empty())
            {
                VersionedID entry = m_recycledIDs.back();
                m_recycledIDs.pop_back();
                return entry;
            }

            // ID_MASK itself is reserved so no live handle equals Entity::INVALID
            if (m_nextID >= INVALID_ID)
            {
                return {INVALID_ID, 0};
            }

            return {m_nextID++, INITIAL_VERSION};
        }

        void Recycle(IDType id, VersionType nextVersion)
        {
            MORPH_ASSERT(id < m_nextID, "Recycling an id that was never allocated");
            m_recycledIDs.push_back({id, nextVersion});
        }

        // One past the highest id ever handed out
        MORPH_NODISCARD IDType GetNextID() const noexcept { return m_nextID; }

        MORPH_NODISCARD std::size_t RecycledCount() const noexcept { return m_recycledIDs.size(); }

        void Clear() noexcept
        {
            m_recycledIDs.clear();
            m_nextID = 0;
        }

    private:
        std::vector<VersionedID> m_recycledIDs;
        IDType m_nextID = 0;
    };
}
