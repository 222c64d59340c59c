#include <Arbor/Runtime.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace Arbor
{
    namespace
    {
        [[nodiscard]] bool ParseSwitch(std::string value) noexcept
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value == "1" || value == "true" || value == "yes" || value == "on";
        }
    }// namespace

    RuntimeOptions RuntimeOptions::FromEnvironment()
    {
        return FromEnvironment([](std::string_view name) -> std::optional<std::string> {
            const std::string key(name);
            if (const char* value = std::getenv(key.c_str()))
                return std::string(value);
            return std::nullopt;
        });
    }

    RuntimeOptions RuntimeOptions::FromEnvironment(const EnvironmentLookup& lookup)
    {
        RuntimeOptions options;
        if (auto path = lookup("ARBOR_SCHEMA_PATH"); path && !path->empty())
            options.schemaPath = std::move(*path);
        if (auto trace = lookup("ARBOR_TRACE"))
            options.builder.traceConstruction = ParseSwitch(std::move(*trace));
        if (auto level = lookup("ARBOR_LOG_LEVEL"); level && !level->empty())
        {
            options.logLevel = Diagnostics::ParseLogLevel(*level);
            if (!options.logLevel)
                Diagnostics::Log(Diagnostics::LogLevel::Warning, "Runtime", "ignoring unknown ARBOR_LOG_LEVEL '{}'",
                                 *level);
        }
        return options;
    }

    Runtime::Runtime(RuntimeOptions options, std::shared_ptr<const Schema::SchemaDatabase> schema)
        : m_options(std::move(options)), m_schema(std::move(schema)), m_pool(m_options.pool)
    {
    }

    Expected<std::unique_ptr<Runtime>> Runtime::Create(RuntimeOptions options)
    {
        if (options.logLevel)
            Diagnostics::SetLogLevel(*options.logLevel);

        std::shared_ptr<const Schema::SchemaDatabase> schema;
        if (options.schemaPath)
        {
            Diagnostics::Log(Diagnostics::LogLevel::Debug, "Runtime", "using schema from {}", *options.schemaPath);
            auto loaded = Schema::LoadSchema(*options.schemaPath, options.schemaLoad);
            if (!loaded)
                return std::unexpected(std::move(loaded.error()));
            schema = std::make_shared<const Schema::SchemaDatabase>(std::move(*loaded));
        }
        else
        {
            Diagnostics::Log(Diagnostics::LogLevel::Debug, "Runtime", "using built-in schema");
            // The built-in table lives for the whole process.
            schema = std::shared_ptr<const Schema::SchemaDatabase>(&Schema::SchemaDatabase::Builtin(),
                                                                   [](const Schema::SchemaDatabase*) {});
        }

        if (options.builder.traceConstruction)
            Diagnostics::Log(Diagnostics::LogLevel::Info, "Runtime", "construction tracing enabled");

        return std::unique_ptr<Runtime>(new Runtime(std::move(options), std::move(schema)));
    }

    Html::HtmlBuilder Runtime::MakeBuilder(Tree::Arena& arena) const
    {
        return Html::HtmlBuilder(arena, *m_schema, m_options.builder);
    }
}// namespace Arbor
