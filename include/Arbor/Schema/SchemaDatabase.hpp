/// @file SchemaDatabase.hpp
/// @brief Process-wide, read-only table of tag metadata used for construction-time validation.
#pragma once

#include <Arbor/Core/Error.hpp>
#include <Arbor/Defines.hpp>
#include <Arbor/Schema/ContentCategory.hpp>
#include <Arbor/Schema/TagMeta.hpp>
#include <Arbor/Schema/TagRecord.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace Arbor::Schema
{
    /// @brief Immutable schema. Build once at startup, then share by const reference.
    ///
    /// All queries are const and touch no mutable state, so a published database
    /// can be read from any number of threads without synchronization. TagMeta
    /// addresses are stable for the lifetime of the database (including across moves).
    class ARBOR_API SchemaDatabase
    {
    public:
        /// @brief Build from raw records. Fails with InvalidSchema on duplicate tags,
        ///        empty names or unresolvable permitted-child names.
        [[nodiscard]] static Expected<SchemaDatabase> FromRecords(std::span<const TagRecord> records);

        /// @brief The compiled-in HTML table, built on first use.
        [[nodiscard]] static const SchemaDatabase& Builtin();

        SchemaDatabase(const SchemaDatabase&)            = delete;
        SchemaDatabase& operator=(const SchemaDatabase&) = delete;
        SchemaDatabase(SchemaDatabase&&) noexcept            = default;
        SchemaDatabase& operator=(SchemaDatabase&&) noexcept = default;
        ~SchemaDatabase()                                    = default;

        /// @brief Fails with UnknownTag if `tag` is not registered.
        [[nodiscard]] Expected<const TagMeta*> Lookup(std::string_view tag) const;

        /// @brief nullptr if `tag` is not registered.
        [[nodiscard]] const TagMeta* Find(std::string_view tag) const noexcept;

        [[nodiscard]] const TagMeta* FindById(TagId id) const noexcept;

        /// @brief Fails with DisallowedAttribute unless `attribute` is tag-specific, or
        ///        global and the tag accepts global attributes.
        [[nodiscard]] Expected<void> ValidateAttribute(const TagMeta& tag, std::string_view attribute) const;
        [[nodiscard]] Expected<void> ValidateAttribute(std::string_view tag, std::string_view attribute) const;

        /// @brief Fails with DisallowedChild if `category` is not in the parent's permitted content.
        [[nodiscard]] Expected<void> ValidateChild(const TagMeta& parent, ContentCategory category) const;
        [[nodiscard]] Expected<void> ValidateChild(std::string_view parent, ContentCategory category) const;

        /// @brief An element child is allowed if its tag is listed explicitly or one of its
        ///        categories is permitted.
        [[nodiscard]] Expected<void> ValidateChildElement(const TagMeta& parent, const TagMeta& child) const;

        /// @brief Whitespace-only text is accepted everywhere; other text needs the Text category.
        [[nodiscard]] Expected<void> ValidateText(const TagMeta& parent, std::string_view text) const;

        /// @brief Global and event-handler attributes, plus any `data-*` or `aria-*` name.
        [[nodiscard]] static bool IsGlobalAttribute(std::string_view attribute) noexcept;

        [[nodiscard]] std::span<const TagMeta> Tags() const noexcept { return m_tags; }
        [[nodiscard]] UIntSize Size() const noexcept { return m_tags.size(); }

    private:
        SchemaDatabase() = default;

        std::vector<TagMeta> m_tags;
        std::vector<TagId>   m_byName;///< Tag ids sorted by tag name.
    };

    [[nodiscard]] ARBOR_API bool IsWhitespaceOnly(std::string_view text) noexcept;

    /// @brief Records of the compiled-in HTML table.
    [[nodiscard]] ARBOR_API std::span<const TagRecord> BuiltinTagRecords();
}// namespace Arbor::Schema
