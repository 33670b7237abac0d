#pragma once

#include <new>
#include <type_traits>
#include <utility>

#include "Base.hpp"
#include "Error.hpp"

namespace Morph
{
    template<typename E>
    struct ErrorValue
    {
        E value;

        constexpr explicit ErrorValue(const E& e) : value(e) {}
        constexpr explicit ErrorValue(E&& e) : value(std::move(e)) {}
    };

    template<typename E>
    constexpr ErrorValue<std::decay_t<E>> Err(E&& e)
    {
        return ErrorValue<std::decay_t<E>>(std::forward<E>(e));
    }

    /**
    * Value-or-error return type used by every fallible operation.
    * Holds either a T or an E, never both, never neither.
    */
    template<typename T, typename E = Error>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        Result(const T& value) : m_hasValue(true) { ::new (&m_value) T(value); }
        Result(T&& value) : m_hasValue(true) { ::new (&m_value) T(std::move(value)); }
        Result(const ErrorValue<E>& err) : m_hasValue(false) { ::new (&m_error) E(err.value); }
        Result(ErrorValue<E>&& err) : m_hasValue(false) { ::new (&m_error) E(std::move(err.value)); }

        Result(const Result& other) : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                ::new (&m_value) T(other.m_value);
            else
                ::new (&m_error) E(other.m_error);
        }

        Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                ::new (&m_value) T(std::move(other.m_value));
            else
                ::new (&m_error) E(std::move(other.m_error));
        }

        Result& operator=(Result other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        {
            Destroy();
            m_hasValue = other.m_hasValue;
            if (m_hasValue)
                ::new (&m_value) T(std::move(other.m_value));
            else
                ::new (&m_error) E(std::move(other.m_error));
            return *this;
        }

        ~Result() { Destroy(); }

        MORPH_NODISCARD static Result Ok(T value) { return Result(std::move(value)); }
        MORPH_NODISCARD static Result Err(E error) { return Result(ErrorValue<E>(std::move(error))); }

        MORPH_NODISCARD constexpr bool IsOk() const noexcept { return m_hasValue; }
        MORPH_NODISCARD constexpr bool IsErr() const noexcept { return !m_hasValue; }
        MORPH_NODISCARD constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr T& Value() &
        {
            MORPH_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr const T& Value() const&
        {
            MORPH_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr T&& Value() &&
        {
            MORPH_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return std::move(m_value);
        }

        constexpr const E& Error() const&
        {
            MORPH_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        constexpr T& operator*() & { return Value(); }
        constexpr const T& operator*() const& { return Value(); }

        template<typename U>
        MORPH_NODISCARD constexpr T ValueOr(U&& fallback) const&
        {
            return m_hasValue ? m_value : static_cast<T>(std::forward<U>(fallback));
        }

    private:
        void Destroy() noexcept
        {
            if (m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<T>)
                    m_value.~T();
            }
            else
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                    m_error.~E();
            }
        }

        union
        {
            T m_value;
            E m_error;
        };
        bool m_hasValue;
    };

    template<typename E>
    class Result<void, E>
    {
    public:
        using ValueType = void;
        using ErrorType = E;

        constexpr Result() noexcept : m_hasValue(true), m_error() {}
        constexpr Result(const ErrorValue<E>& err) : m_hasValue(false), m_error(err.value) {}
        constexpr Result(ErrorValue<E>&& err) : m_hasValue(false), m_error(std::move(err.value)) {}

        MORPH_NODISCARD static Result Ok() { return Result(); }
        MORPH_NODISCARD static Result Err(E error) { return Result(ErrorValue<E>(std::move(error))); }

        MORPH_NODISCARD constexpr bool IsOk() const noexcept { return m_hasValue; }
        MORPH_NODISCARD constexpr bool IsErr() const noexcept { return !m_hasValue; }
        MORPH_NODISCARD constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr const E& Error() const&
        {
            MORPH_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

    private:
        bool m_hasValue;
        E m_error;
    };

    template<typename T, typename E>
    MORPH_NODISCARD constexpr bool operator==(const Result<T, E>& lhs, const ErrorValue<E>& rhs)
    {
        return lhs.IsErr() && lhs.Error() == rhs.value;
    }
}
