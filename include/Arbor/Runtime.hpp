/// @file Runtime.hpp
/// @brief Process-wide setup: the immutable schema and the shared arena pool.
#pragma once

#include <Arbor/Core/Error.hpp>
#include <Arbor/Defines.hpp>
#include <Arbor/Diagnostics/Log.hpp>
#include <Arbor/Html/Builder.hpp>
#include <Arbor/Schema/SchemaDatabase.hpp>
#include <Arbor/Schema/SchemaLoader.hpp>
#include <Arbor/Tree/ArenaPool.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Arbor
{
    /// Returns the value of an environment variable, or nullopt when unset.
    using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

    struct RuntimeOptions
    {
        /// JSON file or directory of per-tag JSON files. Unset selects the built-in table.
        std::optional<std::string>           schemaPath {};
        Schema::SchemaLoadOptions            schemaLoad {};
        Html::BuilderOptions                 builder {};
        Tree::ArenaPoolOptions               pool {};
        std::optional<Diagnostics::LogLevel> logLevel {};

        /// @brief Options from ARBOR_SCHEMA_PATH, ARBOR_TRACE and ARBOR_LOG_LEVEL.
        [[nodiscard]] ARBOR_API static RuntimeOptions FromEnvironment();
        [[nodiscard]] ARBOR_API static RuntimeOptions FromEnvironment(const EnvironmentLookup& lookup);
    };

    /// @brief Owns what all workers share. Create it once at startup.
    class ARBOR_API Runtime
    {
    public:
        /// @brief Apply the log level, load the schema and set up the pool.
        ///
        /// Fails with SchemaIO, SchemaParse or InvalidSchema when an external
        /// schema cannot be used.
        [[nodiscard]] static Expected<std::unique_ptr<Runtime>> Create(RuntimeOptions options = {});

        Runtime(const Runtime&)            = delete;
        Runtime& operator=(const Runtime&) = delete;

        [[nodiscard]] const Schema::SchemaDatabase& GetSchema() const noexcept { return *m_schema; }
        [[nodiscard]] std::shared_ptr<const Schema::SchemaDatabase> SharedSchema() const noexcept { return m_schema; }
        [[nodiscard]] Tree::ArenaPool& Pool() noexcept { return m_pool; }
        [[nodiscard]] const RuntimeOptions& Options() const noexcept { return m_options; }

        /// @brief A builder for `arena` with this runtime's schema and builder options.
        [[nodiscard]] Html::HtmlBuilder MakeBuilder(Tree::Arena& arena) const;

    private:
        Runtime(RuntimeOptions options, std::shared_ptr<const Schema::SchemaDatabase> schema);

        RuntimeOptions                                m_options;
        std::shared_ptr<const Schema::SchemaDatabase> m_schema;
        Tree::ArenaPool                               m_pool;
    };
}// namespace Arbor
