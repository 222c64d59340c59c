/// @file SchemaLoaderTests.cpp
/// @brief Tests for reading tag records from JSON text, files and directories.

#include <Arbor/Schema/SchemaLoader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace Arbor;
using namespace Arbor::Schema;

namespace
{
    constexpr const char* kListRecords = R"([
        {
            "tag_name": "ul",
            "struct_name": "UnorderedList",
            "submodule_name": "text",
            "has_global_attributes": true,
            "has_closing_tag": true,
            "attributes": [],
            "content_categories": ["Flow", "Palpable"],
            "permitted_child_elements": ["ListItem"]
        },
        {
            "tag_name": "li",
            "struct_name": "ListItem",
            "has_global_attributes": true,
            "has_closing_tag": true,
            "attributes": [
                {"name": "value", "description": "Ordinal value", "field_name": "value", "ty": "Integer"},
                {"name": "type", "description": "", "ty": {"Enumerable": ["a", "A", "i"]}},
                {"name": "target", "description": "", "ty": {"Identifier": "NavigableTargetName"}}
            ],
            "content_categories": [],
            "permitted_child_elements": ["Text"],
            "mdn_link": {"ignored": [1, 2, {"deep": null}]}
        },
        {
            "tag_name": "br",
            "struct_name": "LineBreak",
            "has_global_attributes": false,
            "has_closing_tag": false,
            "attributes": [],
            "content_categories": ["Flow", "Phrasing"],
            "permitted_child_elements": []
        }
    ])";

    /// Temporary directory removed when the test ends.
    class ScratchDirectory
    {
    public:
        ScratchDirectory()
        {
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            m_path = std::filesystem::temp_directory_path() / ("arbor-schema-" + std::to_string(stamp));
            std::filesystem::create_directories(m_path);
        }

        ~ScratchDirectory()
        {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        std::string Write(const std::string& name, const std::string& content) const
        {
            const auto    file = m_path / name;
            std::ofstream out(file, std::ios::binary);
            out << content;
            return file.string();
        }

        [[nodiscard]] std::string Path() const { return m_path.string(); }

    private:
        std::filesystem::path m_path;
    };
}// namespace

TEST_CASE("ParseTagRecords reads the record format", "[Schema][SchemaLoader]")
{
    auto records = ParseTagRecords(kListRecords);
    REQUIRE(records.has_value());
    REQUIRE(records->size() == 3);

    const TagRecord& ul = (*records)[0];
    CHECK(ul.tagName == "ul");
    CHECK(ul.structName == "UnorderedList");
    CHECK(ul.categories.size() == 2);
    CHECK(ul.permittedChildren == std::vector<std::string> {"ListItem"});

    const TagRecord& li = (*records)[1];
    REQUIRE(li.attributes.size() == 3);
    CHECK(li.attributes[0].kind == AttributeKind::Integer);
    CHECK(li.attributes[0].description == "Ordinal value");
    CHECK(li.attributes[1].kind == AttributeKind::Enumerable);
    CHECK(li.attributes[1].enumValues.size() == 3);
    CHECK(li.attributes[2].kind == AttributeKind::Identifier);
    CHECK(li.attributes[2].identifier == "NavigableTargetName");

    const TagRecord& br = (*records)[2];
    CHECK_FALSE(br.hasClosingTag);
    CHECK_FALSE(br.hasGlobalAttributes);
}

TEST_CASE("ParseTagRecords accepts a single record object", "[Schema][SchemaLoader]")
{
    auto records = ParseTagRecords(R"({"tag_name": "p", "content_categories": ["Flow"], "permitted_content": ["Phrasing"]})");
    REQUIRE(records.has_value());
    REQUIRE(records->size() == 1);
    CHECK((*records)[0].permittedContent.size() == 1);
}

TEST_CASE("ParseTagRecords reports malformed input", "[Schema][SchemaLoader]")
{
    SECTION("syntax error")
    {
        auto records = ParseTagRecords("[{\"tag_name\": }]");
        REQUIRE_FALSE(records.has_value());
        CHECK(records.error().code == ErrorCode::SchemaParse);
        CHECK(records.error().message.find("line 1") != std::string::npos);
    }
    SECTION("unknown category")
    {
        auto records = ParseTagRecords(R"([{"tag_name": "x", "content_categories": ["Bogus"]}])");
        REQUIRE_FALSE(records.has_value());
        CHECK(records.error().message.find("Bogus") != std::string::npos);
    }
    SECTION("unknown attribute type")
    {
        auto records = ParseTagRecords(R"([{"tag_name": "x", "attributes": [{"name": "a", "ty": "Colour"}]}])");
        REQUIRE_FALSE(records.has_value());
        CHECK(records.error().code == ErrorCode::SchemaParse);
    }
    SECTION("record without tag name")
    {
        CHECK_FALSE(ParseTagRecords(R"([{"struct_name": "X"}])").has_value());
    }
}

TEST_CASE("LoadSchema builds a database from a file", "[Schema][SchemaLoader]")
{
    ScratchDirectory dir;
    const std::string path = dir.Write("lists.json", kListRecords);

    auto db = LoadSchema(path);
    REQUIRE(db.has_value());
    CHECK(db->Size() == 3);

    const TagMeta& ul = *db->Find("ul");
    const TagMeta& li = *db->Find("li");
    CHECK(db->ValidateChildElement(ul, li).has_value());
    CHECK(db->ValidateText(li, "text").has_value());
    CHECK_FALSE(db->ValidateAttribute("br", "class").has_value());
}

TEST_CASE("ReadTagRecords reads every JSON file of a directory in name order", "[Schema][SchemaLoader]")
{
    ScratchDirectory dir;
    dir.Write("b.json", R"({"tag_name": "second"})");
    dir.Write("a.json", R"([{"tag_name": "first"}])");
    dir.Write("notes.txt", "not json");

    auto records = ReadTagRecords(dir.Path());
    REQUIRE(records.has_value());
    REQUIRE(records->size() == 2);
    CHECK((*records)[0].tagName == "first");
    CHECK((*records)[1].tagName == "second");
}

TEST_CASE("ReadTagRecords reports missing files", "[Schema][SchemaLoader]")
{
    auto records = ReadTagRecords("/nonexistent/arbor/schema.json");
    REQUIRE_FALSE(records.has_value());
    CHECK(records.error().code == ErrorCode::SchemaIO);
    CHECK(records.error().subject == "/nonexistent/arbor/schema.json");
}

TEST_CASE("LoadSchema rejects unresolvable children", "[Schema][SchemaLoader]")
{
    ScratchDirectory dir;
    const std::string path = dir.Write("bad.json", R"([{"tag_name": "x", "permitted_child_elements": ["Nope"]}])");

    auto db = LoadSchema(path);
    REQUIRE_FALSE(db.has_value());
    CHECK(db.error().code == ErrorCode::InvalidSchema);
}
