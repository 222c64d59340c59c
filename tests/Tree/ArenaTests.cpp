/// @file ArenaTests.cpp
/// @brief Tests for node allocation, handle validity and cross-arena adoption.

#include <Arbor/Diagnostics/Contract.hpp>
#include <Arbor/Schema/SchemaDatabase.hpp>
#include <Arbor/Tree/Arena.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Arbor;
using namespace Arbor::Tree;

namespace
{
    struct ContractFailure : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    /// Turns contract violations into exceptions for the lifetime of the guard.
    class ThrowingContracts
    {
    public:
        ThrowingContracts()
            : m_previous(Diagnostics::SetContractViolationHandler(
                      [](std::string_view message, const std::source_location&) {
                          throw ContractFailure(std::string(message));
                      }))
        {
        }

        ~ThrowingContracts()
        {
            Diagnostics::SetContractViolationHandler(m_previous);
        }

    private:
        Diagnostics::ContractViolationHandler m_previous;
    };

    const Schema::TagMeta& Tag(std::string_view name)
    {
        return *Schema::SchemaDatabase::Builtin().Find(name);
    }
}// namespace

TEST_CASE("Arena allocates nodes in order", "[Tree][Arena]")
{
    Arena arena;
    CHECK(arena.IsEmpty());

    auto text = arena.AllocateText("hello");
    REQUIRE(text.has_value());
    CHECK(text->Slot() == 0);
    CHECK(text->Region() == arena.Region());

    const std::vector<NodeHandle> children {*text};
    const Attribute               attributes[] {{"class", "greeting"}};
    auto element = arena.Allocate(Node::MakeElement(Tag("p"), attributes, children));
    REQUIRE(element.has_value());
    CHECK(element->Slot() == 1);
    CHECK(arena.Size() == 2);

    const NodeView view = arena.View(*element);
    CHECK(view.IsElement());
    CHECK(view.TagName() == "p");
    CHECK(view.FindAttribute("class") == "greeting");
    CHECK_FALSE(view.FindAttribute("id").has_value());
    REQUIRE(view.ChildCount() == 1);
    CHECK(view.Child(0).Text() == "hello");
}

TEST_CASE("Arena copies payload it does not own", "[Tree][Arena]")
{
    Arena arena;
    NodeHandle handle;
    {
        std::string temporary = "transient";
        handle                = *arena.AllocateText(temporary);
        temporary.assign("overwritten");
    }
    CHECK(arena.View(handle).Text() == "transient");
    CHECK(arena.PayloadBytes() >= 9);
}

TEST_CASE("Arena rejects duplicate attributes", "[Tree][Arena]")
{
    Arena           arena;
    const Attribute attributes[] {{"id", "a"}, {"class", "x"}, {"id", "b"}};
    auto            result = arena.Allocate(Node::MakeElement(Tag("div"), attributes, {}));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::DuplicateAttribute);
    CHECK(result.error().subject == "id");
    CHECK(arena.IsEmpty());
}

TEST_CASE("Arena enforces its node limit", "[Tree][Arena]")
{
    Arena arena(ArenaOptions {.maxNodes = 2});
    REQUIRE(arena.AllocateText("a").has_value());
    REQUIRE(arena.AllocateText("b").has_value());

    auto third = arena.AllocateText("c");
    REQUIRE_FALSE(third.has_value());
    CHECK(third.error().code == ErrorCode::CapacityExceeded);
    CHECK(arena.Size() == 2);
}

TEST_CASE("Arena rejects children from other arenas", "[Tree][Arena]")
{
    Arena first;
    Arena second;
    auto  foreign = *first.AllocateText("elsewhere");
    auto  local   = *second.AllocateText("here");

    const NodeHandle children[] {local, foreign};
    auto             result = second.AllocateFragment(children);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidHandle);
    CHECK(result.error().index == 1);
    CHECK_FALSE(second.IsValid(foreign));
    CHECK_FALSE(second.IsValid(NodeHandle {}));
}

TEST_CASE("Arena Reset invalidates every handle", "[Tree][Arena]")
{
    ThrowingContracts contracts;

    Arena arena;
    auto  handle     = *arena.AllocateText("before");
    auto  generation = arena.Generation();

    arena.Reset();
    CHECK(arena.IsEmpty());
    CHECK(arena.Generation() == static_cast<UInt8>(generation + 1));
    CHECK_FALSE(arena.IsValid(handle));

    auto checked = arena.TryResolve(handle);
    REQUIRE_FALSE(checked.has_value());
    CHECK(checked.error().code == ErrorCode::InvalidHandle);
    CHECK_THROWS_AS(arena.Resolve(handle), ContractFailure);

    // The slot is reused, but under a new generation.
    auto after = *arena.AllocateText("after");
    CHECK(after.Slot() == handle.Slot());
    CHECK(after != handle);
}

TEST_CASE("Arena handles stay invalid after the generation wraps", "[Tree][Arena]")
{
    Arena      arena;
    const auto stale  = *arena.AllocateText("before");
    const auto region = arena.Region();

    for (int i = 0; i <= RegionId::kMaxGeneration; ++i)
        arena.Reset();

    CHECK(arena.Generation() == 0);
    CHECK(arena.Region() != region);
    CHECK(arena.Region().ArenaId() != region.ArenaId());

    const auto fresh = *arena.AllocateText("after");
    CHECK(fresh.Slot() == stale.Slot());
    CHECK(fresh != stale);
    CHECK(arena.IsValid(fresh));
    CHECK_FALSE(arena.IsValid(stale));
    CHECK_FALSE(arena.TryResolve(stale).has_value());
}

TEST_CASE("Arena resolves adopted arenas' handles", "[Tree][Arena]")
{
    auto source = std::make_shared<Arena>();
    auto shared = *source->AllocateText("shared");

    Arena target;
    CHECK_FALSE(target.IsValid(shared));
    REQUIRE(target.Adopt(source).has_value());
    CHECK(target.DependsOn(*source));
    CHECK(target.IsValid(shared));
    CHECK(target.View(shared).Text() == "shared");

    // Adopting twice keeps one dependency.
    REQUIRE(target.Adopt(source).has_value());
    CHECK(target.DependencyCount() == 1);

    const NodeHandle children[] {shared};
    auto             fragment = target.AllocateFragment(children);
    REQUIRE(fragment.has_value());
    CHECK(target.View(*fragment).Child(0).Text() == "shared");

    // Payload of the adopted arena is referenced, not copied.
    auto view = target.View(shared);
    auto copy = target.AllocateText(view.Text());
    REQUIRE(copy.has_value());
    CHECK(target.View(*copy).Text().data() == view.Text().data());

    target.Reset();
    CHECK(target.DependencyCount() == 0);
    CHECK(source.use_count() == 1);
}

TEST_CASE("Arena refuses adoption cycles", "[Tree][Arena]")
{
    auto a = std::make_shared<Arena>();
    auto b = std::make_shared<Arena>();
    REQUIRE(b->Adopt(a).has_value());

    auto cycle = a->Adopt(b);
    REQUIRE_FALSE(cycle.has_value());
    CHECK(cycle.error().code == ErrorCode::DependencyCycle);

    auto self = a->Adopt(a);
    REQUIRE_FALSE(self.has_value());
    CHECK(self.error().code == ErrorCode::DependencyCycle);
}

TEST_CASE("Arena keeps pre-serialized fragments alive", "[Tree][Arena]")
{
    Arena arena;
    auto  fragment   = std::make_shared<SerializedFragment>();
    fragment->outer  = &Tag("p");
    fragment->html   = "<p>cached</p>";
    std::weak_ptr<const SerializedFragment> weak = fragment;

    auto handle = arena.AllocatePreSerialized(std::move(fragment));
    REQUIRE(handle.has_value());
    CHECK_FALSE(weak.expired());

    const NodeView view = arena.View(*handle);
    CHECK(view.IsPreSerialized());
    CHECK(view.Text() == "<p>cached</p>");
    CHECK(view.TagName() == "p");

    arena.Reset();
    CHECK(weak.expired());
}

TEST_CASE("Arena treats an element without tag as a contract violation", "[Tree][Arena]")
{
    ThrowingContracts contracts;
    Arena             arena;
    Node              node;
    node.kind = NodeKind::Element;
    CHECK_THROWS_AS(arena.Allocate(node), ContractFailure);
}
