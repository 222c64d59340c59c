/// @file SchemaLoader.hpp
/// @brief Loading tag records from the JSON produced by the metadata tooling.
///
/// Each record is an object with the keys `tag_name`, `struct_name`,
/// `has_global_attributes`, `has_closing_tag`, `attributes`,
/// `content_categories`, `permitted_child_elements` and the optional
/// `permitted_content`. Attribute objects carry `name`, `description` and
/// `ty`, where `ty` is one of "Bool", "KString", "Integer", "Float",
/// {"Identifier": "..."} or {"Enumerable": [...]}. Unknown keys are ignored.
#pragma once

#include <Arbor/Core/Error.hpp>
#include <Arbor/Defines.hpp>
#include <Arbor/Schema/SchemaDatabase.hpp>
#include <Arbor/Schema/TagRecord.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace Arbor::Schema
{
    struct SchemaLoadOptions
    {
        bool     allowComments {true};
        UIntSize maxDepth {32};
    };

    /// @brief Parse one record object, or an array of record objects.
    [[nodiscard]] ARBOR_API Expected<std::vector<TagRecord>>
    ParseTagRecords(std::string_view json, const SchemaLoadOptions& options = {});

    /// @brief Read records from a JSON file, or from every `*.json` file in a directory
    ///        (in file name order).
    [[nodiscard]] ARBOR_API Expected<std::vector<TagRecord>>
    ReadTagRecords(const std::string& path, const SchemaLoadOptions& options = {});

    /// @brief ReadTagRecords followed by SchemaDatabase::FromRecords.
    [[nodiscard]] ARBOR_API Expected<SchemaDatabase>
    LoadSchema(const std::string& path, const SchemaLoadOptions& options = {});
}// namespace Arbor::Schema
