#pragma once

#include <cstdint>
#include <functional>

namespace Morph
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        InvalidArgument,
        OutOfBounds,
        InvalidState,

        InvalidEntity,
        ComponentNotFound,
        UnsupportedOperation,

        CapacityExceeded,

        Unknown = 0xFFFFFFFF
    };

    struct Error
    {
        ErrorCode code;
        const char* message;

        constexpr Error(ErrorCode c = ErrorCode::None, const char* msg = nullptr) noexcept
            : code(c), message(msg ? msg : GetDefaultMessage(c))
        {}

        [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        [[nodiscard]] constexpr bool operator==(ErrorCode other) const noexcept
        {
            return code == other;
        }

        [[nodiscard]] static constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
        {
            switch (code)
            {
                case ErrorCode::None: return "No error";
                case ErrorCode::InvalidArgument: return "Invalid argument";
                case ErrorCode::OutOfBounds: return "Entity id outside the allocated range";
                case ErrorCode::InvalidState: return "Invalid state";
                case ErrorCode::InvalidEntity: return "Entity is not alive";
                case ErrorCode::ComponentNotFound: return "Component not found";
                case ErrorCode::UnsupportedOperation: return "Operation not supported by component type";
                case ErrorCode::CapacityExceeded: return "Capacity exceeded";
                case ErrorCode::Unknown: return "Unknown error";
                default: return "Unspecified error";
            }
        }
    };

    inline constexpr Error MakeError(ErrorCode code, const char* message = nullptr) noexcept
    {
        return Error(code, message);
    }
}

namespace std
{
    template<>
    struct hash<Morph::Error>
    {
        std::size_t operator()(const Morph::Error& e) const noexcept
        {
            return std::hash<std::uint32_t>{}(static_cast<std::uint32_t>(e.code));
        }
    };
}
