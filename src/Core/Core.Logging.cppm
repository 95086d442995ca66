module;
#include <format>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    // Ordered by severity; messages below the configured minimum are dropped.
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error,
        Off
    };

    void SetMinimumLevel(Level level);
    [[nodiscard]] Level GetMinimumLevel();
    [[nodiscard]] bool IsEnabled(Level level);

    // Thread-safe sink shared by the formatting front-ends below.
    void PrintColored(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Info))
            PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Warning))
            PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Error))
            PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args)
    {
#ifndef NDEBUG
        if (IsEnabled(Level::Debug))
            PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
