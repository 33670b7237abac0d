#pragma once

#include <cstdint>
#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>

#include "Base.hpp"
#include "Profile.hpp"

namespace Morph
{
    enum class LogLevel : std::uint8_t
    {
        Debug = 0,
        Info,
        Warn,
        Error,
        Off
    };

    /**
    * Sink for log messages. Install a custom one with Log::SetLogger().
    */
    class ILogger
    {
    public:
        virtual ~ILogger() = default;

        /**
        * @param level Severity
        * @param tag Subsystem tag ("World", "Accessor", "Transmuter", ...)
        * @param message Message body
        */
        virtual void Write(LogLevel level, std::string_view tag, std::string_view message) = 0;
    };

    namespace Detail
    {
        class StderrLogger final : public ILogger
        {
        public:
            void Write(LogLevel level, std::string_view tag, std::string_view message) override
            {
                static constexpr const char* LEVEL_NAMES[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};
                const auto index = static_cast<unsigned>(level);
                if (index >= std::size(LEVEL_NAMES))
                    return;

                std::fprintf(stderr, "[%s][%.*s] %.*s\n",
                    LEVEL_NAMES[index],
                    static_cast<int>(tag.size()), tag.data(),
                    static_cast<int>(message.size()), message.data());
            }
        };
    }

    /**
    * Static logging facade. Not thread-safe, same as the world it reports on.
    */
    class Log final
    {
    public:
        Log() = delete;

        static void SetLogger(ILogger* logger) noexcept
        {
            s_logger = logger ? logger : &s_defaultLogger;
        }

        static void SetMinLevel(LogLevel level) noexcept { s_minLevel = level; }
        MORPH_NODISCARD static LogLevel GetMinLevel() noexcept { return s_minLevel; }

        MORPH_NODISCARD static bool IsEnabled(LogLevel level) noexcept
        {
            return level >= s_minLevel && level != LogLevel::Off;
        }

        static void Debug(std::string_view tag, std::string_view message) { Dispatch(LogLevel::Debug, tag, message); }
        static void Info(std::string_view tag, std::string_view message) { Dispatch(LogLevel::Info, tag, message); }
        static void Warn(std::string_view tag, std::string_view message) { Dispatch(LogLevel::Warn, tag, message); }
        static void Error(std::string_view tag, std::string_view message) { Dispatch(LogLevel::Error, tag, message); }

    private:
        static void Dispatch(LogLevel level, std::string_view tag, std::string_view message)
        {
            if (!IsEnabled(level))
                return;
#if MORPH_PROFILE_ENABLED
            MORPH_PROFILE_MESSAGE(message.data(), message.size());
#endif
            s_logger->Write(level, tag, message);
        }

        inline static Detail::StderrLogger s_defaultLogger;
        inline static ILogger* s_logger = &s_defaultLogger;
        inline static LogLevel s_minLevel = LogLevel::Warn;
    };
}
