/// @file TagRecord.hpp
/// @brief Raw per-tag records from which a SchemaDatabase is built.
#pragma once

#include <Arbor/Schema/ContentCategory.hpp>
#include <Arbor/Schema/TagMeta.hpp>

#include <string>
#include <vector>

namespace Arbor::Schema
{
    struct AttributeRecord
    {
        std::string              name;
        std::string              description {};
        AttributeKind            kind {AttributeKind::Text};
        std::string              identifier {};
        std::vector<std::string> enumValues {};
    };

    /// @brief One tag as delivered by the external metadata source.
    ///
    /// permittedChildren names tags either by tag name ("li") or by struct
    /// name ("Li"). The entry "Text" adds ContentCategory::Text to the
    /// permitted content instead.
    struct TagRecord
    {
        std::string                  tagName;
        std::string                  structName {};
        bool                         hasGlobalAttributes {true};
        bool                         hasClosingTag {true};
        std::vector<AttributeRecord> attributes {};
        std::vector<ContentCategory> categories {};
        std::vector<ContentCategory> permittedContent {};
        std::vector<std::string>     permittedChildren {};
    };
}// namespace Arbor::Schema
