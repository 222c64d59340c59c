/// @file Log.hpp
/// @brief Minimal leveled logging with a replaceable sink.
///
/// Messages are tagged with the emitting component. The default sink writes
/// `[Component] message` lines to std::cerr.
#pragma once

#include <Arbor/Defines.hpp>
#include <Arbor/Primitives.hpp>

#include <format>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace Arbor::Diagnostics
{
    enum class LogLevel : UInt8
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Off,
    };

    using LogSink = std::function<void(LogLevel level, std::string_view component, std::string_view message)>;

    /// @brief Set the minimum level that reaches the sink. Default is Warning.
    ARBOR_API void SetLogLevel(LogLevel level) noexcept;
    [[nodiscard]] ARBOR_API LogLevel GetLogLevel() noexcept;

    [[nodiscard]] ARBOR_API bool IsLogEnabled(LogLevel level) noexcept;

    /// @brief Replace the sink. Passing an empty function restores the std::cerr sink.
    ///
    /// The sink runs without any log lock held, so it may itself log, but it
    /// can be called from several threads at once.
    ARBOR_API void SetLogSink(LogSink sink);

    ARBOR_API void WriteLog(LogLevel level, std::string_view component, std::string_view message);

    [[nodiscard]] ARBOR_API std::string_view ToString(LogLevel level) noexcept;
    [[nodiscard]] ARBOR_API std::optional<LogLevel> ParseLogLevel(std::string_view text) noexcept;

    template<typename... Args>
    void Log(LogLevel level, std::string_view component, std::format_string<Args...> format, Args&&... args)
    {
        if (!IsLogEnabled(level))
            return;
        WriteLog(level, component, std::format(format, std::forward<Args>(args)...));
    }
}// namespace Arbor::Diagnostics
