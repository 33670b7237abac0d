#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>

#include "../Core/Base.hpp"

namespace Morph
{
    template<std::size_t Bits>
    class Bitmap
    {
    public:
        static constexpr std::size_t BITS_PER_WORD = 64;
        static constexpr std::size_t WORD_COUNT = (Bits + BITS_PER_WORD - 1) / BITS_PER_WORD;

        using Word = std::uint64_t;

        constexpr Bitmap() noexcept = default;

        constexpr void Set(std::size_t index) noexcept
        {
            if (index < Bits) MORPH_LIKELY
            {
                m_words[index / BITS_PER_WORD] |= (Word(1) << (index % BITS_PER_WORD));
            }
        }

        constexpr void Reset(std::size_t index) noexcept
        {
            if (index < Bits) MORPH_LIKELY
            {
                m_words[index / BITS_PER_WORD] &= ~(Word(1) << (index % BITS_PER_WORD));
            }
        }

        MORPH_NODISCARD constexpr bool Test(std::size_t index) const noexcept
        {
            if (index >= Bits) MORPH_UNLIKELY return false;
            return (m_words[index / BITS_PER_WORD] & (Word(1) << (index % BITS_PER_WORD))) != 0;
        }

        // True if every bit of mask is also set here
        MORPH_NODISCARD constexpr bool HasAll(const Bitmap& mask) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if ((m_words[i] & mask.m_words[i]) != mask.m_words[i])
                    return false;
            }
            return true;
        }

        MORPH_NODISCARD constexpr bool HasAny(const Bitmap& mask) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if ((m_words[i] & mask.m_words[i]) != 0)
                    return true;
            }
            return false;
        }

        MORPH_NODISCARD constexpr bool operator==(const Bitmap& other) const noexcept = default;

        MORPH_NODISCARD constexpr Bitmap operator&(const Bitmap& other) const noexcept
        {
            Bitmap result;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
                result.m_words[i] = m_words[i] & other.m_words[i];
            return result;
        }

        MORPH_NODISCARD constexpr Bitmap operator|(const Bitmap& other) const noexcept
        {
            Bitmap result;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
                result.m_words[i] = m_words[i] | other.m_words[i];
            return result;
        }

        // Bits set here and clear in other
        MORPH_NODISCARD constexpr Bitmap Without(const Bitmap& other) const noexcept
        {
            Bitmap result;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
                result.m_words[i] = m_words[i] & ~other.m_words[i];
            return result;
        }

        MORPH_NODISCARD constexpr std::size_t Count() const noexcept
        {
            std::size_t count = 0;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
                count += static_cast<std::size_t>(std::popcount(m_words[i]));
            return count;
        }

        MORPH_NODISCARD constexpr bool Any() const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if (m_words[i] != 0) return true;
            }
            return false;
        }

        MORPH_NODISCARD constexpr bool None() const noexcept { return !Any(); }

        /**
        * Calls func(index) for each set bit, lowest index first.
        */
        template<typename Func>
        constexpr void ForEachSetBit(Func&& func) const
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                Word word = m_words[i];
                while (word != 0)
                {
                    const auto bit = static_cast<std::size_t>(std::countr_zero(word));
                    func(i * BITS_PER_WORD + bit);
                    word &= word - 1;
                }
            }
        }

        MORPH_NODISCARD std::size_t GetHash() const noexcept
        {
            std::size_t hash = 0;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                hash ^= static_cast<std::size_t>(m_words[i]) + 0x9E3779B97F4A7C15ULL + (hash << 6) + (hash >> 2);
            }
            return hash;
        }

    private:
        std::array<Word, WORD_COUNT> m_words{};
    };

    template<std::size_t Bits>
    struct BitmapHash
    {
        std::size_t operator()(const Bitmap<Bits>& bitmap) const noexcept
        {
            return bitmap.GetHash();
        }
    };
}
