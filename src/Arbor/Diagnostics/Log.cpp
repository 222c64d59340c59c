#include <Arbor/Diagnostics/Log.hpp>

#include <atomic>
#include <cctype>
#include <iostream>
#include <memory>
#include <mutex>

namespace Arbor::Diagnostics
{
    namespace
    {
        std::atomic<LogLevel> g_level {LogLevel::Warning};

        struct SinkState
        {
            std::mutex                     mutex;
            std::shared_ptr<const LogSink> sink;
        };

        SinkState& Sink()
        {
            static SinkState state;
            return state;
        }

        [[nodiscard]] bool EqualsIgnoreCase(std::string_view text, std::string_view lowered) noexcept
        {
            if (text.size() != lowered.size())
                return false;
            for (UIntSize i = 0; i < text.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(text[i])) != lowered[i])
                    return false;
            }
            return true;
        }

        void WriteToStdErr(LogLevel level, std::string_view component, std::string_view message)
        {
            if (level >= LogLevel::Warning)
                std::cerr << "[" << component << "] " << ToString(level) << ": " << message << std::endl;
            else
                std::cerr << "[" << component << "] " << message << std::endl;
        }
    }// namespace

    void SetLogLevel(LogLevel level) noexcept
    {
        g_level.store(level, std::memory_order_relaxed);
    }

    LogLevel GetLogLevel() noexcept
    {
        return g_level.load(std::memory_order_relaxed);
    }

    bool IsLogEnabled(LogLevel level) noexcept
    {
        const LogLevel minimum = GetLogLevel();
        return level != LogLevel::Off && minimum != LogLevel::Off && level >= minimum;
    }

    void SetLogSink(LogSink sink)
    {
        auto&                       state = Sink();
        auto replacement = sink ? std::make_shared<const LogSink>(std::move(sink)) : nullptr;
        std::lock_guard<std::mutex> lock(state.mutex);
        state.sink = std::move(replacement);
    }

    void WriteLog(LogLevel level, std::string_view component, std::string_view message)
    {
        if (!IsLogEnabled(level))
            return;
        auto&                          state = Sink();
        std::shared_ptr<const LogSink> sink;
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (!state.sink)
            {
                WriteToStdErr(level, component, message);
                return;
            }
            sink = state.sink;
        }
        // Called unlocked so a sink may log or replace itself.
        (*sink)(level, component, message);
    }

    std::string_view ToString(LogLevel level) noexcept
    {
        switch (level)
        {
            case LogLevel::Trace:
                return "trace";
            case LogLevel::Debug:
                return "debug";
            case LogLevel::Info:
                return "info";
            case LogLevel::Warning:
                return "warning";
            case LogLevel::Error:
                return "error";
            case LogLevel::Off:
                return "off";
        }
        return "unknown";
    }

    std::optional<LogLevel> ParseLogLevel(std::string_view text) noexcept
    {
        constexpr LogLevel levels[] = {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                                       LogLevel::Warning, LogLevel::Error, LogLevel::Off};
        for (const LogLevel level: levels)
        {
            if (EqualsIgnoreCase(text, ToString(level)))
                return level;
        }
        if (EqualsIgnoreCase(text, "warn"))
            return LogLevel::Warning;
        return std::nullopt;
    }
}// namespace Arbor::Diagnostics
