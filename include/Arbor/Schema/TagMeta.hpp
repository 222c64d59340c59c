/// @file TagMeta.hpp
/// @brief Immutable per-tag metadata held by the SchemaDatabase.
#pragma once

#include <Arbor/Primitives.hpp>
#include <Arbor/Schema/ContentCategory.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace Arbor::Schema
{
    using TagId = UInt16;

    /// @brief Declared value type of an attribute. Values themselves are not checked.
    enum class AttributeKind : UInt8
    {
        Bool,
        Text,
        Integer,
        Float,
        Identifier,
        Enumerable,
    };

    struct AttributeMeta
    {
        std::string              name;
        std::string              description;
        AttributeKind            kind {AttributeKind::Text};
        std::string              identifier; ///< Set when kind == Identifier.
        std::vector<std::string> enumValues; ///< Set when kind == Enumerable.
    };

    struct TagMeta
    {
        TagId       id {0};
        std::string name;
        std::string structName;
        CategorySet categories;       ///< Categories the element itself belongs to.
        CategorySet permittedContent; ///< Child categories it accepts; includes Text if it accepts text.
        std::vector<TagId> permittedChildren; ///< Explicitly allowed child tags, sorted.
        bool hasClosingTag {true};
        bool hasGlobalAttributes {true};
        std::vector<AttributeMeta> attributes;///< Sorted by name.

        [[nodiscard]] const AttributeMeta* FindAttribute(std::string_view attribute) const noexcept
        {
            auto it = std::lower_bound(attributes.begin(), attributes.end(), attribute,
                                       [](const AttributeMeta& a, std::string_view n) { return a.name < n; });
            if (it == attributes.end() || it->name != attribute)
                return nullptr;
            return &*it;
        }

        [[nodiscard]] bool PermitsChildTag(TagId child) const noexcept
        {
            return std::binary_search(permittedChildren.begin(), permittedChildren.end(), child);
        }

        [[nodiscard]] bool AllowsText() const noexcept
        {
            return permittedContent.Contains(ContentCategory::Text);
        }
    };
}// namespace Arbor::Schema
