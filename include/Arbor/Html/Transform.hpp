/// @file Transform.hpp
/// @brief Read-only walks and structure-sharing transformations of node trees.
///
/// Transformations never modify existing nodes. Unchanged subtrees are reused
/// by handle; only the nodes on the path to a change are rebuilt.
#pragma once

#include <Arbor/Core/Error.hpp>
#include <Arbor/Defines.hpp>
#include <Arbor/Html/Builder.hpp>
#include <Arbor/Tree/Arena.hpp>

#include <functional>
#include <span>
#include <string_view>
#include <vector>

namespace Arbor::Html
{
    enum class VisitAction : UInt8
    {
        Continue,
        SkipChildren,
        Stop,
    };

    using VisitFunction = std::function<VisitAction(const Tree::NodeView& node, UIntSize depth)>;

    /// @brief Pre-order walk of `root` in child order.
    /// @return false if the walk was cut short by VisitAction::Stop.
    ARBOR_API bool Visit(const Tree::Arena& arena, NodeHandle root, const VisitFunction& visitor);

    /// @brief Handles of every element named `tag` below and including `root`, in document order.
    [[nodiscard]] ARBOR_API std::vector<NodeHandle> CollectElements(const Tree::Arena& arena, NodeHandle root,
                                                                    std::string_view tag);

    /// @brief Number of node occurrences reachable from `root`. Shared subtrees count once per use.
    [[nodiscard]] ARBOR_API UIntSize CountNodes(const Tree::Arena& arena, NodeHandle root);

    /// @brief What a map function decided for one node.
    class MapResult
    {
    public:
        enum class Kind : UInt8
        {
            Keep,   ///< Reuse the node; its children are still mapped.
            Remove, ///< Drop the node and its subtree.
            Replace,///< Substitute one handle. The replacement is not mapped further.
            Splice, ///< Substitute any number of handles, none mapped further.
            Unwrap, ///< Drop the node but keep its mapped children in its place.
        };

        [[nodiscard]] static MapResult Keep() { return MapResult(Kind::Keep); }
        [[nodiscard]] static MapResult Remove() { return MapResult(Kind::Remove); }
        [[nodiscard]] static MapResult Unwrap() { return MapResult(Kind::Unwrap); }

        [[nodiscard]] static MapResult Replace(NodeHandle replacement)
        {
            MapResult result(Kind::Replace);
            result.m_handles.push_back(replacement);
            return result;
        }

        [[nodiscard]] static MapResult Splice(std::span<const NodeHandle> handles)
        {
            MapResult result(Kind::Splice);
            result.m_handles.assign(handles.begin(), handles.end());
            return result;
        }

        [[nodiscard]] Kind GetKind() const noexcept { return m_kind; }
        [[nodiscard]] std::span<const NodeHandle> Handles() const noexcept { return m_handles; }

    private:
        explicit MapResult(Kind kind) noexcept
            : m_kind(kind)
        {
        }

        Kind                    m_kind;
        std::vector<NodeHandle> m_handles;
    };

    /// Called once per node, parents before children. New nodes are built with the given builder.
    using MapFunction = std::function<Expected<MapResult>(const Tree::NodeView& node, HtmlBuilder& builder)>;

    /// @brief Apply `mapper` to the tree at `root` in `source`, building changes with `dest`.
    ///
    /// Handles of `source` must resolve in the destination arena, so `source` is
    /// either that arena or one it has adopted. Rebuilt elements are validated
    /// like freshly built ones. When nothing changes the result is `root` itself.
    /// A root that maps to zero or several nodes is wrapped in a fragment.
    [[nodiscard]] ARBOR_API Expected<NodeHandle> Map(HtmlBuilder& dest, const Tree::Arena& source, NodeHandle root,
                                                     const MapFunction& mapper);
    [[nodiscard]] ARBOR_API Expected<NodeHandle> Map(HtmlBuilder& dest, NodeHandle root, const MapFunction& mapper);

    using FilterPredicate = std::function<bool(const Tree::NodeView& node)>;

    /// @brief Drop every node (below `root`) for which `keep` returns false.
    [[nodiscard]] ARBOR_API Expected<NodeHandle> Filter(HtmlBuilder& dest, NodeHandle root, const FilterPredicate& keep);

    /// @brief Replace each `tag` element by its children. With `strict`, only wrappers
    ///        that carry no attributes are unwrapped.
    [[nodiscard]] ARBOR_API Expected<NodeHandle> UnwrapElements(HtmlBuilder& dest, NodeHandle root, std::string_view tag,
                                                                bool strict = false);
}// namespace Arbor::Html
