/// @file SchemaDatabaseTests.cpp
/// @brief Tests for tag lookup and attribute/child validation.

#include <Arbor/Schema/SchemaDatabase.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace Arbor;
using namespace Arbor::Schema;

TEST_CASE("SchemaDatabase looks up built-in tags", "[Schema][SchemaDatabase]")
{
    const SchemaDatabase& db = SchemaDatabase::Builtin();
    CHECK(db.Size() > 100);

    auto a = db.Lookup("a");
    REQUIRE(a.has_value());
    CHECK((*a)->name == "a");
    CHECK((*a)->structName == "A");
    CHECK((*a)->hasClosingTag);
    CHECK(db.FindById((*a)->id) == *a);

    const TagMeta* br = db.Find("br");
    REQUIRE(br != nullptr);
    CHECK_FALSE(br->hasClosingTag);

    auto unknown = db.Lookup("blink");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::UnknownTag);
    CHECK(unknown.error().tag == "blink");
}

TEST_CASE("SchemaDatabase accepts every declared attribute", "[Schema][SchemaDatabase]")
{
    const SchemaDatabase& db = SchemaDatabase::Builtin();
    for (const TagMeta& tag: db.Tags())
    {
        for (const AttributeMeta& attribute: tag.attributes)
        {
            INFO("<" << tag.name << " " << attribute.name << ">");
            CHECK(db.ValidateAttribute(tag, attribute.name).has_value());
        }
        auto rejected = db.ValidateAttribute(tag, "not-an-attribute");
        REQUIRE_FALSE(rejected.has_value());
        CHECK(rejected.error().code == ErrorCode::DisallowedAttribute);
        CHECK(rejected.error().subject == "not-an-attribute");
    }
}

TEST_CASE("SchemaDatabase accepts global attributes", "[Schema][SchemaDatabase]")
{
    const SchemaDatabase& db = SchemaDatabase::Builtin();
    CHECK(db.ValidateAttribute("a", "href").has_value());
    CHECK(db.ValidateAttribute("div", "class").has_value());
    CHECK(db.ValidateAttribute("div", "onclick").has_value());
    CHECK(db.ValidateAttribute("span", "data-id").has_value());
    CHECK(db.ValidateAttribute("span", "aria-label").has_value());

    CHECK(SchemaDatabase::IsGlobalAttribute("title"));
    CHECK_FALSE(SchemaDatabase::IsGlobalAttribute("data-"));
    CHECK_FALSE(SchemaDatabase::IsGlobalAttribute("href"));

    auto href = db.ValidateAttribute("div", "href");
    REQUIRE_FALSE(href.has_value());
    CHECK(href.error().tag == "div");
    CHECK(href.error().message.find("global attributes") != std::string::npos);

    auto unknownTag = db.ValidateAttribute("blink", "class");
    REQUIRE_FALSE(unknownTag.has_value());
    CHECK(unknownTag.error().code == ErrorCode::UnknownTag);
}

TEST_CASE("SchemaDatabase validates child categories", "[Schema][SchemaDatabase]")
{
    const SchemaDatabase& db = SchemaDatabase::Builtin();
    CHECK(db.ValidateChild("div", ContentCategory::Flow).has_value());
    CHECK(db.ValidateChild("p", ContentCategory::Phrasing).has_value());

    auto flowInP = db.ValidateChild("p", ContentCategory::Flow);
    REQUIRE_FALSE(flowInP.has_value());
    CHECK(flowInP.error().code == ErrorCode::DisallowedChild);
    CHECK(flowInP.error().tag == "p");

    auto textInUl = db.ValidateChild("ul", ContentCategory::Text);
    REQUIRE_FALSE(textInUl.has_value());
    CHECK(textInUl.error().code == ErrorCode::DisallowedChild);
}

TEST_CASE("SchemaDatabase checks every tag against every child category", "[Schema][SchemaDatabase]")
{
    const SchemaDatabase& db = SchemaDatabase::Builtin();
    UIntSize              accepted = 0;
    UIntSize              rejected = 0;
    for (const TagMeta& tag: db.Tags())
    {
        for (UIntSize i = 0; i < kContentCategoryCount; ++i)
        {
            const auto category = static_cast<ContentCategory>(i);
            INFO("<" << tag.name << "> with " << ToString(category) << " child");

            auto result = db.ValidateChild(tag, category);
            if (tag.permittedContent.Contains(category))
            {
                CHECK(result.has_value());
                ++accepted;
                continue;
            }
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == ErrorCode::DisallowedChild);
            CHECK(result.error().tag == tag.name);
            ++rejected;
        }
    }
    CHECK(accepted > 0);
    CHECK(rejected > 0);
}

TEST_CASE("SchemaDatabase validates child elements", "[Schema][SchemaDatabase]")
{
    const SchemaDatabase& db = SchemaDatabase::Builtin();
    const TagMeta&        a    = *db.Find("a");
    const TagMeta&        area = *db.Find("area");
    const TagMeta&        map  = *db.Find("map");
    const TagMeta&        ul   = *db.Find("ul");
    const TagMeta&        li   = *db.Find("li");
    const TagMeta&        span = *db.Find("span");
    const TagMeta&        div  = *db.Find("div");
    const TagMeta&        p    = *db.Find("p");

    CHECK(db.ValidateChildElement(a, span).has_value());
    CHECK(db.ValidateChildElement(map, area).has_value());
    CHECK(db.ValidateChildElement(ul, li).has_value());
    CHECK(db.ValidateChildElement(div, p).has_value());

    auto areaInA = db.ValidateChildElement(a, area);
    REQUIRE_FALSE(areaInA.has_value());
    CHECK(areaInA.error().code == ErrorCode::DisallowedChild);
    CHECK(areaInA.error().tag == "a");
    CHECK(areaInA.error().subject == "area");

    CHECK_FALSE(db.ValidateChildElement(ul, span).has_value());
    CHECK_FALSE(db.ValidateChildElement(p, div).has_value());
}

TEST_CASE("SchemaDatabase always allows whitespace-only text", "[Schema][SchemaDatabase]")
{
    const SchemaDatabase& db = SchemaDatabase::Builtin();
    const TagMeta&        ul = *db.Find("ul");

    CHECK(db.ValidateText(ul, " \n\t ").has_value());
    CHECK(db.ValidateText(ul, "").has_value());
    CHECK_FALSE(db.ValidateText(ul, "item").has_value());
    CHECK(db.ValidateText(*db.Find("p"), "item").has_value());
}

TEST_CASE("SchemaDatabase FromRecords resolves children by tag or struct name", "[Schema][SchemaDatabase]")
{
    std::vector<TagRecord> records(3);
    records[0].tagName           = "list";
    records[0].permittedChildren = {"Item", "Text"};
    records[1].tagName           = "item";
    records[1].categories        = {ContentCategory::Flow};
    records[2].tagName           = "note";
    records[2].hasClosingTag     = false;
    records[2].attributes        = {AttributeRecord {"level", "", AttributeKind::Integer}};

    auto db = SchemaDatabase::FromRecords(records);
    REQUIRE(db.has_value());
    CHECK(db->Size() == 3);

    const TagMeta& list = *db->Find("list");
    const TagMeta& item = *db->Find("item");
    CHECK(list.PermitsChildTag(item.id));
    CHECK(list.AllowsText());
    CHECK(db->ValidateChildElement(list, item).has_value());
    CHECK_FALSE(db->ValidateChildElement(list, *db->Find("note")).has_value());
    CHECK(db->Find("note")->FindAttribute("level") != nullptr);
}

TEST_CASE("SchemaDatabase FromRecords rejects malformed records", "[Schema][SchemaDatabase]")
{
    SECTION("duplicate tag")
    {
        std::vector<TagRecord> records(2);
        records[0].tagName = "x";
        records[1].tagName = "x";
        auto db            = SchemaDatabase::FromRecords(records);
        REQUIRE_FALSE(db.has_value());
        CHECK(db.error().code == ErrorCode::InvalidSchema);
    }
    SECTION("duplicate attribute")
    {
        std::vector<TagRecord> records(1);
        records[0].tagName    = "x";
        records[0].attributes = {AttributeRecord {"a"}, AttributeRecord {"a"}};
        auto db               = SchemaDatabase::FromRecords(records);
        REQUIRE_FALSE(db.has_value());
        CHECK(db.error().subject == "a");
    }
    SECTION("unknown child")
    {
        std::vector<TagRecord> records(1);
        records[0].tagName           = "x";
        records[0].permittedChildren = {"Missing"};
        auto db                      = SchemaDatabase::FromRecords(records);
        REQUIRE_FALSE(db.has_value());
        CHECK(db.error().code == ErrorCode::InvalidSchema);
        CHECK(db.error().subject == "Missing");
    }
    SECTION("empty tag name")
    {
        std::vector<TagRecord> records(1);
        CHECK_FALSE(SchemaDatabase::FromRecords(records).has_value());
    }
}
