/// @file RuntimeTests.cpp
/// @brief Tests for environment configuration and runtime start-up.

#include <Arbor/Html/Serializer.hpp>
#include <Arbor/Runtime.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

using namespace Arbor;

namespace
{
    EnvironmentLookup FakeEnvironment(std::map<std::string, std::string> values)
    {
        return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
            const auto it = values.find(std::string(name));
            if (it == values.end())
                return std::nullopt;
            return it->second;
        };
    }

    class LogLevelGuard
    {
    public:
        LogLevelGuard() : m_level(Diagnostics::GetLogLevel()) {}
        ~LogLevelGuard() { Diagnostics::SetLogLevel(m_level); }

    private:
        Diagnostics::LogLevel m_level;
    };

    constexpr const char* kParagraphOnly = R"([
        {
            "tag_name": "p",
            "struct_name": "Paragraph",
            "has_global_attributes": true,
            "has_closing_tag": true,
            "attributes": [],
            "content_categories": ["Flow", "Palpable"],
            "permitted_child_elements": ["Phrasing", "Text"]
        }
    ])";
}// namespace

TEST_CASE("FromEnvironment reads the ARBOR_ variables", "[Runtime]")
{
    SECTION("nothing set keeps the defaults")
    {
        const RuntimeOptions options = RuntimeOptions::FromEnvironment(FakeEnvironment({}));
        CHECK_FALSE(options.schemaPath.has_value());
        CHECK_FALSE(options.logLevel.has_value());
        CHECK_FALSE(options.builder.traceConstruction);
        CHECK(options.builder.validate);
    }

    SECTION("every variable set")
    {
        const RuntimeOptions options = RuntimeOptions::FromEnvironment(FakeEnvironment({
                {"ARBOR_SCHEMA_PATH", "/srv/schema"},
                {"ARBOR_TRACE", "Yes"},
                {"ARBOR_LOG_LEVEL", "debug"},
        }));
        REQUIRE(options.schemaPath.has_value());
        CHECK(*options.schemaPath == "/srv/schema");
        CHECK(options.builder.traceConstruction);
        CHECK(options.logLevel == Diagnostics::LogLevel::Debug);
    }

    SECTION("unrecognised values are ignored")
    {
        const RuntimeOptions options = RuntimeOptions::FromEnvironment(FakeEnvironment({
                {"ARBOR_SCHEMA_PATH", ""},
                {"ARBOR_TRACE", "maybe"},
                {"ARBOR_LOG_LEVEL", "loud"},
        }));
        CHECK_FALSE(options.schemaPath.has_value());
        CHECK_FALSE(options.builder.traceConstruction);
        CHECK_FALSE(options.logLevel.has_value());
    }
}

TEST_CASE("Runtime uses the built-in schema by default", "[Runtime]")
{
    LogLevelGuard guard;
    auto          runtime = Runtime::Create();
    REQUIRE(runtime.has_value());

    CHECK(&(*runtime)->GetSchema() == &Schema::SchemaDatabase::Builtin());

    Tree::ArenaLease  arena   = (*runtime)->Pool().Acquire();
    Html::HtmlBuilder builder = (*runtime)->MakeBuilder(*arena);
    auto              page    = builder.P({}, {builder.Text("hi")});
    REQUIRE(page.has_value());
    CHECK(Html::ToHtml(*arena, *page) == "<p>hi</p>");
}

TEST_CASE("Runtime applies the configured log level", "[Runtime]")
{
    LogLevelGuard  guard;
    RuntimeOptions options;
    options.logLevel = Diagnostics::LogLevel::Error;

    REQUIRE(Runtime::Create(options).has_value());
    CHECK(Diagnostics::GetLogLevel() == Diagnostics::LogLevel::Error);
}

TEST_CASE("Runtime loads an external schema", "[Runtime]")
{
    LogLevelGuard guard;
    const auto    stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto    path  = std::filesystem::temp_directory_path() / ("arbor-runtime-" + std::to_string(stamp) + ".json");
    {
        std::ofstream out(path, std::ios::binary);
        out << kParagraphOnly;
    }

    RuntimeOptions options;
    options.schemaPath = path.string();
    auto runtime       = Runtime::Create(options);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    REQUIRE(runtime.has_value());

    const auto& schema = (*runtime)->GetSchema();
    CHECK(schema.Size() == 1);
    CHECK(schema.Find("p") != nullptr);
    CHECK(schema.Find("div") == nullptr);

    Tree::ArenaLease  arena   = (*runtime)->Pool().Acquire();
    Html::HtmlBuilder builder = (*runtime)->MakeBuilder(*arena);
    CHECK(builder.P({}, {builder.Text("ok")}).has_value());

    auto missing = builder.Div({}, {});
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::UnknownTag);
}

TEST_CASE("Runtime reports an unreadable schema path", "[Runtime]")
{
    LogLevelGuard  guard;
    RuntimeOptions options;
    options.schemaPath = (std::filesystem::temp_directory_path() / "arbor-no-such-schema.json").string();

    auto runtime = Runtime::Create(options);
    REQUIRE_FALSE(runtime.has_value());
    CHECK(runtime.error().code == ErrorCode::SchemaIO);
}

TEST_CASE("MakeBuilder carries the builder options", "[Runtime]")
{
    LogLevelGuard  guard;
    RuntimeOptions options;
    options.builder.traceConstruction = true;

    auto runtime = Runtime::Create(options);
    REQUIRE(runtime.has_value());

    Tree::ArenaLease  arena   = (*runtime)->Pool().Acquire();
    Html::HtmlBuilder builder = (*runtime)->MakeBuilder(*arena);
    CHECK(builder.Options().traceConstruction);

    auto node = builder.Span({}, {});
    REQUIRE(node.has_value());
    CHECK(Html::ToHtml(*arena, *node).find("title=\"Generated at:") != std::string::npos);
}
