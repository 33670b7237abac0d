#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Log.hpp"

namespace Morph
{
    using CompositionID = std::uint32_t;

    /**
    * Interns component masks. Every distinct set of component types an entity
    * has ever owned gets a small dense id; id 0 is the empty set. Ids are never
    * released.
    */
    class CompositionTable
    {
    public:
        static constexpr CompositionID EMPTY = 0;

        CompositionTable()
        {
            m_masks.emplace_back();
            m_lookup.emplace(ComponentMask{}, EMPTY);
        }

        MORPH_NODISCARD CompositionID GetOrCreate(const ComponentMask& mask)
        {
            if (auto it = m_lookup.find(mask); it != m_lookup.end())
            {
                return it->second;
            }

            const auto id = static_cast<CompositionID>(m_masks.size());
            m_masks.push_back(mask);
            m_lookup.emplace(mask, id);

            if (Log::IsEnabled(LogLevel::Debug))
            {
                Log::Debug("World", "composition " + std::to_string(id) + " interned with "
                    + std::to_string(mask.Count()) + " component type(s)");
            }
            return id;
        }

        MORPH_NODISCARD const ComponentMask& GetMask(CompositionID id) const noexcept
        {
            MORPH_ASSERT(id < m_masks.size(), "Unknown composition id");
            return m_masks[id];
        }

        MORPH_NODISCARD std::size_t Size() const noexcept { return m_masks.size(); }

    private:
        std::vector<ComponentMask> m_masks;
        std::unordered_map<ComponentMask, CompositionID, BitmapHash<MAX_COMPONENTS>> m_lookup;
    };
}
