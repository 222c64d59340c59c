/// @file Node.hpp
/// @brief Immutable node variants stored in an Arena.
#pragma once

#include <Arbor/Primitives.hpp>
#include <Arbor/Schema/TagMeta.hpp>
#include <Arbor/Tree/NodeHandle.hpp>

#include <span>
#include <string>
#include <string_view>

namespace Arbor::Tree
{
    enum class NodeKind : UInt8
    {
        Element,
        Text,
        PreSerialized,
        Fragment,
    };

    struct Attribute
    {
        std::string_view name;
        std::string_view value;
    };

    /// @brief Rendered HTML of one element subtree, reusable in any arena.
    struct SerializedFragment
    {
        const Schema::TagMeta* outer {nullptr};///< Tag of the rendered element, used for child validation.
        std::string            html;
    };

    /// @brief One arena slot. Never modified after allocation.
    ///
    /// Which members are meaningful depends on kind:
    ///  - Element: tag, attributes, children
    ///  - Text: text
    ///  - PreSerialized: serialized (text views its bytes)
    ///  - Fragment: children
    struct Node
    {
        NodeKind                   kind {NodeKind::Fragment};
        const Schema::TagMeta*     tag {nullptr};
        std::span<const Attribute> attributes {};
        std::span<const NodeHandle> children {};
        std::string_view           text {};
        const SerializedFragment*  serialized {nullptr};

        [[nodiscard]] static Node MakeElement(const Schema::TagMeta& tag, std::span<const Attribute> attributes,
                                              std::span<const NodeHandle> children) noexcept
        {
            Node node;
            node.kind       = NodeKind::Element;
            node.tag        = &tag;
            node.attributes = attributes;
            node.children   = children;
            return node;
        }

        [[nodiscard]] static Node MakeText(std::string_view text) noexcept
        {
            Node node;
            node.kind = NodeKind::Text;
            node.text = text;
            return node;
        }

        [[nodiscard]] static Node MakeFragment(std::span<const NodeHandle> children) noexcept
        {
            Node node;
            node.kind     = NodeKind::Fragment;
            node.children = children;
            return node;
        }
    };

    [[nodiscard]] constexpr std::string_view ToString(NodeKind kind) noexcept
    {
        switch (kind)
        {
            case NodeKind::Element:
                return "Element";
            case NodeKind::Text:
                return "Text";
            case NodeKind::PreSerialized:
                return "PreSerialized";
            case NodeKind::Fragment:
                return "Fragment";
        }
        return "Unknown";
    }
}// namespace Arbor::Tree
