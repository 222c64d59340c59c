/// @file Builder.hpp
/// @brief Schema-validated construction of HTML nodes into an Arena.
///
/// Every element is checked against the SchemaDatabase when it is built, so an
/// invalid tree is never allocated:
///
/// @code
/// HtmlBuilder b(arena, SchemaDatabase::Builtin());
/// auto link = b.A({{"href", "/x"}}, {b.Text("text")});
/// @endcode
#pragma once

#include <Arbor/Core/Error.hpp>
#include <Arbor/Defines.hpp>
#include <Arbor/Html/Tags.hpp>
#include <Arbor/Schema/SchemaDatabase.hpp>
#include <Arbor/Tree/Arena.hpp>

#include <array>
#include <concepts>
#include <initializer_list>
#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Arbor::Html
{
    using Tree::NodeHandle;

    struct BuilderOptions
    {
        bool validate {true};
        /// Attach the construction site of every element as a diagnostic attribute.
        bool traceConstruction {false};
    };

    /// @brief One attribute argument. Absent arguments are skipped.
    class AttributeArg
    {
    public:
        AttributeArg(std::string_view name, std::string_view value)
            : m_name(name), m_value(value)
        {
        }

        AttributeArg(std::string_view name, const char* value)
            : m_name(name), m_value(value), m_present(value != nullptr)
        {
        }

        AttributeArg(std::string_view name, const std::string& value)
            : m_name(name), m_value(value)
        {
        }

        AttributeArg(std::string_view name, std::optional<std::string_view> value)
            : m_name(name), m_value(value.value_or(std::string_view {})), m_present(value.has_value())
        {
        }

        /// @brief Boolean attribute: present with an empty value when true, absent when false.
        AttributeArg(std::string_view name, bool flag)
            : m_name(name), m_present(flag)
        {
        }

        template<std::integral T>
            requires(!std::same_as<T, bool> && !std::same_as<T, char>)
        AttributeArg(std::string_view name, T number)
            : m_name(name), m_owned(std::to_string(number)), m_usesOwned(true)
        {
        }

        [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
        [[nodiscard]] std::string_view Value() const noexcept { return m_usesOwned ? std::string_view {m_owned} : m_value; }
        [[nodiscard]] bool IsPresent() const noexcept { return m_present; }

    private:
        std::string_view m_name;
        std::string_view m_value {};
        std::string      m_owned {};
        bool             m_present {true};
        bool             m_usesOwned {false};
    };

    [[nodiscard]] inline AttributeArg Att(std::string_view name, std::string_view value)
    {
        return AttributeArg(name, value);
    }

    [[nodiscard]] inline AttributeArg OptAtt(std::string_view name, std::optional<std::string_view> value)
    {
        return AttributeArg(name, value);
    }

    /// @brief A child argument: one handle, a list of handles, or the result of a nested
    ///        builder call. A failed nested call makes the enclosing call fail with its error.
    class Child
    {
    public:
        Child(NodeHandle handle) noexcept
            : m_single(handle)
        {
        }

        Child(const Expected<NodeHandle>& result) noexcept
        {
            if (result)
                m_single = *result;
            else
                m_error = &result.error();
        }

        Child(std::span<const NodeHandle> handles) noexcept
            : m_many(handles), m_isList(true)
        {
        }

        Child(const std::vector<NodeHandle>& handles) noexcept
            : m_many(handles), m_isList(true)
        {
        }

        [[nodiscard]] const Error* Failure() const noexcept { return m_error; }

        [[nodiscard]] std::span<const NodeHandle> Handles() const noexcept
        {
            if (m_isList)
                return m_many;
            return {&m_single, 1};
        }

    private:
        NodeHandle                  m_single {};
        std::span<const NodeHandle> m_many {};
        const Error*                m_error {nullptr};
        bool                        m_isList {false};
    };

    /// @brief Typed, validating node constructor bound to one arena and one schema.
    ///
    /// Construction only appends to the arena. Child handles must resolve in the
    /// target arena (use Graft for subtrees built elsewhere).
    class ARBOR_API HtmlBuilder
    {
    public:
        using Attributes = std::initializer_list<AttributeArg>;
        using Children   = std::initializer_list<Child>;

        HtmlBuilder(Tree::Arena& arena, const Schema::SchemaDatabase& schema, BuilderOptions options = {});

        [[nodiscard]] Tree::Arena& GetArena() const noexcept { return *m_arena; }
        [[nodiscard]] const Schema::SchemaDatabase& GetSchema() const noexcept { return *m_schema; }
        [[nodiscard]] const BuilderOptions& Options() const noexcept { return m_options; }

        [[nodiscard]] Expected<NodeHandle> Element(std::string_view tag, Attributes attributes = {}, Children children = {},
                                                   const std::source_location& location = std::source_location::current());

        [[nodiscard]] Expected<NodeHandle> Element(KnownTag tag, Attributes attributes = {}, Children children = {},
                                                   const std::source_location& location = std::source_location::current());

        [[nodiscard]] Expected<NodeHandle> Element(const Schema::TagMeta& tag, std::span<const AttributeArg> attributes,
                                                   std::span<const Child> children,
                                                   const std::source_location& location = std::source_location::current());

#define ARBOR_TAG_METHOD(Method, Name)                                                                             \
    [[nodiscard]] Expected<NodeHandle> Method(Attributes attributes = {}, Children children = {},                 \
                                              const std::source_location& location = std::source_location::current()) \
    {                                                                                                              \
        return Element(KnownTag::Method, attributes, children, location);                                         \
    }
        ARBOR_HTML_TAGS(ARBOR_TAG_METHOD)
#undef ARBOR_TAG_METHOD

        [[nodiscard]] Expected<NodeHandle> Text(std::string_view text);
        /// @brief Text node, or an empty fragment when `text` is absent.
        [[nodiscard]] Expected<NodeHandle> OptText(std::optional<std::string_view> text);
        /// @brief A single non-breaking space.
        [[nodiscard]] Expected<NodeHandle> Nbsp();

        [[nodiscard]] Expected<NodeHandle> Fragment(Children children);
        [[nodiscard]] Expected<NodeHandle> Fragment(std::span<const NodeHandle> children);
        /// @brief An empty fragment; renders as nothing.
        [[nodiscard]] Expected<NodeHandle> Empty();

        [[nodiscard]] Expected<NodeHandle> PreSerialized(std::shared_ptr<const Tree::SerializedFragment> fragment);

        /// @brief Make `root` of `source` usable as a child here. The target arena adopts
        ///        `source` and keeps it alive.
        [[nodiscard]] Expected<NodeHandle> Graft(std::shared_ptr<const Tree::Arena> source, NodeHandle root);

        /// @brief New element or fragment like `original` but with other children. The
        ///        attribute list of `original` is shared, not copied. Leaf nodes are
        ///        returned unchanged.
        [[nodiscard]] Expected<NodeHandle> Rebuild(const Tree::NodeView& original, std::span<const NodeHandle> children);

        /// @brief Check that `children` resolve here and may appear inside `parent`.
        [[nodiscard]] Expected<void> ValidateChildren(const Schema::TagMeta& parent,
                                                      std::span<const NodeHandle> children) const;

    private:
        [[nodiscard]] Expected<void> ValidateChild(const Schema::TagMeta& parent, const Tree::NodeView& child) const;
        [[nodiscard]] Expected<void> CollectChildren(std::span<const Child> children, std::vector<NodeHandle>& out) const;

        Tree::Arena*                                      m_arena;
        const Schema::SchemaDatabase*                     m_schema;
        BuilderOptions                                    m_options;
        std::array<const Schema::TagMeta*, kKnownTagCount> m_known {};
    };
}// namespace Arbor::Html
