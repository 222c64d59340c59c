/// @file LogTests.cpp
/// @brief Tests for log level filtering, level parsing and sink replacement.

#include <Arbor/Diagnostics/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace Arbor::Diagnostics;

namespace
{
    struct Captured
    {
        LogLevel    level;
        std::string component;
        std::string message;
    };

    /// Restores the process-wide level and sink when the test ends.
    class LogScope
    {
    public:
        LogScope() : m_level(GetLogLevel())
        {
            SetLogSink([this](LogLevel level, std::string_view component, std::string_view message) {
                lines.push_back({level, std::string(component), std::string(message)});
            });
        }

        ~LogScope()
        {
            SetLogSink({});
            SetLogLevel(m_level);
        }

        std::vector<Captured> lines;

    private:
        LogLevel m_level;
    };
}// namespace

TEST_CASE("ParseLogLevel accepts names in any case", "[Diagnostics][Log]")
{
    CHECK(ParseLogLevel("trace") == LogLevel::Trace);
    CHECK(ParseLogLevel("DEBUG") == LogLevel::Debug);
    CHECK(ParseLogLevel("Info") == LogLevel::Info);
    CHECK(ParseLogLevel("warning") == LogLevel::Warning);
    CHECK(ParseLogLevel("WARN") == LogLevel::Warning);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK(ParseLogLevel("off") == LogLevel::Off);
    CHECK_FALSE(ParseLogLevel("verbose").has_value());
    CHECK_FALSE(ParseLogLevel("").has_value());
}

TEST_CASE("Messages below the level are dropped", "[Diagnostics][Log]")
{
    LogScope scope;
    SetLogLevel(LogLevel::Info);

    CHECK_FALSE(IsLogEnabled(LogLevel::Debug));
    CHECK(IsLogEnabled(LogLevel::Info));
    CHECK_FALSE(IsLogEnabled(LogLevel::Off));

    Log(LogLevel::Debug, "Test", "hidden {}", 1);
    Log(LogLevel::Warning, "Test", "shown {} of {}", 2, 3);

    REQUIRE(scope.lines.size() == 1);
    CHECK(scope.lines[0].level == LogLevel::Warning);
    CHECK(scope.lines[0].component == "Test");
    CHECK(scope.lines[0].message == "shown 2 of 3");
}

TEST_CASE("Level Off silences every message", "[Diagnostics][Log]")
{
    LogScope scope;
    SetLogLevel(LogLevel::Off);

    Log(LogLevel::Error, "Test", "nothing");
    WriteLog(LogLevel::Error, "Test", "nothing either");

    CHECK(scope.lines.empty());
    CHECK_FALSE(IsLogEnabled(LogLevel::Error));
}

TEST_CASE("A sink may log from inside the sink", "[Diagnostics][Log]")
{
    LogScope scope;
    SetLogLevel(LogLevel::Info);

    bool nested = false;
    SetLogSink([&](LogLevel level, std::string_view component, std::string_view message) {
        scope.lines.push_back({level, std::string(component), std::string(message)});
        if (!nested)
        {
            nested = true;
            Log(LogLevel::Info, "Sink", "forwarded {}", message);
        }
    });

    Log(LogLevel::Warning, "Test", "outer");
    REQUIRE(scope.lines.size() == 2);
    CHECK(scope.lines[0].message == "outer");
    CHECK(scope.lines[1].component == "Sink");
    CHECK(scope.lines[1].message == "forwarded outer");
}
