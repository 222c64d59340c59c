/// @file BuilderTests.cpp
/// @brief Tests for validated element construction.

#include <Arbor/Diagnostics/Log.hpp>
#include <Arbor/Html/Builder.hpp>
#include <Arbor/Html/Serializer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace Arbor;
using namespace Arbor::Html;

TEST_CASE("HtmlBuilder builds a link end to end", "[Html][Builder]")
{
    const auto& schema = Schema::SchemaDatabase::Builtin();
    Tree::Arena arena;
    HtmlBuilder b(arena, schema);

    REQUIRE(schema.ValidateAttribute("a", "href").has_value());
    auto link = b.A({{"href", "/x"}}, {b.Text("text")});
    REQUIRE(link.has_value());
    CHECK(ToHtml(arena, *link) == R"(<a href="/x">text</a>)");
}

TEST_CASE("HtmlBuilder rejects area inside a", "[Html][Builder]")
{
    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin());

    auto area = b.Area({{"href", "/x"}});
    REQUIRE(area.has_value());
    const auto before = arena.Size();

    auto link = b.A({{"href", "/x"}}, {*area});
    REQUIRE_FALSE(link.has_value());
    CHECK(link.error().code == ErrorCode::DisallowedChild);
    CHECK(link.error().tag == "a");
    CHECK(link.error().subject == "area");
    CHECK(link.error().index == 0);
    CHECK(arena.Size() == before);
}

TEST_CASE("HtmlBuilder accepts every declared attribute of every tag", "[Html][Builder]")
{
    const auto& schema = Schema::SchemaDatabase::Builtin();
    Tree::Arena arena;
    HtmlBuilder b(arena, schema);

    for (const Schema::TagMeta& tag: schema.Tags())
    {
        for (const Schema::AttributeMeta& attribute: tag.attributes)
        {
            const AttributeArg args[] {Att(attribute.name, "v")};
            auto               element = b.Element(tag, args, {});
            INFO("<" << tag.name << " " << attribute.name << ">");
            CHECK(element.has_value());
        }

        const AttributeArg bogus[] {Att("bogus-attribute", "v")};
        auto               rejected = b.Element(tag, bogus, {});
        REQUIRE_FALSE(rejected.has_value());
        CHECK(rejected.error().code == ErrorCode::DisallowedAttribute);
    }
}

TEST_CASE("HtmlBuilder validates text children", "[Html][Builder]")
{
    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin());

    CHECK(b.Ul({}, {b.Text("\n  "), b.Li({}, {b.Text("item")}), b.Text("\n")}).has_value());

    auto text = b.Ul({}, {b.Text("loose")});
    REQUIRE_FALSE(text.has_value());
    CHECK(text.error().code == ErrorCode::DisallowedChild);
}

TEST_CASE("HtmlBuilder reports unknown tags", "[Html][Builder]")
{
    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin());

    auto result = b.Element("blink", {}, {b.Text("hi")});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::UnknownTag);

    auto known = b.Element("p", {Att("class", "x")}, {b.Text("hi")});
    REQUIRE(known.has_value());
    CHECK(ToHtml(arena, *known) == R"(<p class="x">hi</p>)");
}

TEST_CASE("HtmlBuilder propagates the first nested error", "[Html][Builder]")
{
    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin());

    auto page = b.Div({}, {b.P({}, {b.Text("ok")}), b.Span({{"href", "/nope"}}), b.Element("blink")});
    REQUIRE_FALSE(page.has_value());
    CHECK(page.error().code == ErrorCode::DisallowedAttribute);
    CHECK(page.error().tag == "span");
    CHECK(page.error().subject == "href");
}

TEST_CASE("HtmlBuilder rejects duplicate attributes", "[Html][Builder]")
{
    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin());

    auto result = b.Div({{"class", "a"}, {"class", "b"}});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::DuplicateAttribute);
}

TEST_CASE("HtmlBuilder attribute helpers", "[Html][Builder]")
{
    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin());

    const std::optional<std::string_view> noTitle;
    const std::string                     id = "main";
    auto element = b.Input({Att("type", "number"), OptAtt("title", noTitle), {"id", id}, {"maxlength", 12},
                            {"required", true}, {"disabled", false}});
    REQUIRE(element.has_value());
    CHECK(ToHtml(arena, *element) == R"(<input type="number" id="main" maxlength="12" required="">)");
}

TEST_CASE("HtmlBuilder splices handle lists and fragments", "[Html][Builder]")
{
    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin());

    std::vector<NodeHandle> items;
    for (const char* label: {"one", "two"})
        items.push_back(*b.Li({}, {b.Text(label)}));

    auto list = b.Ul({}, {items, b.Li({}, {b.Text("three")})});
    REQUIRE(list.has_value());
    CHECK(ToHtml(arena, *list) == "<ul><li>one</li><li>two</li><li>three</li></ul>");

    auto group = b.Fragment({b.Text("a"), b.Nbsp(), b.Text("b")});
    REQUIRE(group.has_value());
    auto para = b.P({}, {*group, b.Empty(), b.OptText(std::nullopt), b.OptText("!")});
    REQUIRE(para.has_value());
    CHECK(ToHtml(arena, *para) == "<p>a\xC2\xA0" "b!</p>");
}

TEST_CASE("HtmlBuilder validates fragment contents against the parent", "[Html][Builder]")
{
    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin());

    auto blocks = b.Fragment({b.Div(), b.Div()});
    REQUIRE(blocks.has_value());

    auto para = b.P({}, {b.Text("x"), *blocks});
    REQUIRE_FALSE(para.has_value());
    CHECK(para.error().code == ErrorCode::DisallowedChild);
    CHECK(para.error().subject == "div");
    CHECK(para.error().index == 1);
}

TEST_CASE("HtmlBuilder rejects stale and foreign handles", "[Html][Builder]")
{
    Tree::Arena other;
    HtmlBuilder elsewhere(other, Schema::SchemaDatabase::Builtin());
    auto        foreign = elsewhere.Text("foreign");
    REQUIRE(foreign.has_value());

    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin());
    auto        result = b.P({}, {b.Text("local"), *foreign});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidHandle);
    CHECK(result.error().index == 1);
}

TEST_CASE("HtmlBuilder grafts subtrees from other arenas", "[Html][Builder]")
{
    auto source = std::make_shared<Tree::Arena>();
    HtmlBuilder sourceBuilder(*source, Schema::SchemaDatabase::Builtin());
    auto        nav = sourceBuilder.Nav({}, {sourceBuilder.A({{"href", "/"}}, {sourceBuilder.Text("home")})});
    REQUIRE(nav.has_value());

    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin());
    auto        grafted = b.Graft(source, *nav);
    REQUIRE(grafted.has_value());
    CHECK(*grafted == *nav);

    auto body = b.Body({}, {*grafted, b.P({}, {b.Text("content")})});
    REQUIRE(body.has_value());
    CHECK(ToHtml(arena, *body) == R"(<body><nav><a href="/">home</a></nav><p>content</p></body>)");

    std::weak_ptr<Tree::Arena> weak = source;
    source.reset();
    CHECK_FALSE(weak.expired());
    arena.Reset();
    CHECK(weak.expired());
}

TEST_CASE("HtmlBuilder records the construction site when tracing", "[Html][Builder]")
{
    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin(), BuilderOptions {.traceConstruction = true});

    auto traced = b.Span({}, {b.Text("x")});
    REQUIRE(traced.has_value());
    auto title = arena.View(*traced).FindAttribute("title");
    REQUIRE(title.has_value());
    CHECK(title->starts_with("Generated at:\n "));
    CHECK(title->find("BuilderTests.cpp") != std::string_view::npos);

    std::vector<std::string> warnings;
    Diagnostics::SetLogSink([&](Diagnostics::LogLevel level, std::string_view, std::string_view message) {
        if (level == Diagnostics::LogLevel::Warning)
            warnings.emplace_back(message);
    });
    auto titled = b.Span({{"title", "mine"}});
    Diagnostics::SetLogSink({});

    REQUIRE(titled.has_value());
    CHECK(arena.View(*titled).FindAttribute("title") == "mine");
    CHECK(arena.View(*titled).Attributes().size() == 1);
    CHECK(warnings.size() == 1);
}

TEST_CASE("HtmlBuilder without validation allocates anything", "[Html][Builder]")
{
    Tree::Arena arena;
    HtmlBuilder b(arena, Schema::SchemaDatabase::Builtin(), BuilderOptions {.validate = false});

    auto area = b.Area();
    REQUIRE(area.has_value());
    CHECK(b.A({{"bogus", "1"}}, {*area}).has_value());
}
