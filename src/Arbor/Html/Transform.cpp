#include <Arbor/Html/Transform.hpp>

namespace Arbor::Html
{
    namespace
    {
        /// Maps a tree with an explicit stack, so depth is bounded by memory rather than the call stack.
        class TreeMapper
        {
        public:
            TreeMapper(HtmlBuilder& dest, const Tree::Arena& source, const MapFunction& mapper) noexcept
                : m_dest(dest), m_source(source), m_mapper(mapper)
            {
            }

            /// Appends the mapped form of `root` to `out`. Sets `changed` if it differs from `root`.
            Expected<void> MapInto(NodeHandle root, std::vector<NodeHandle>& out, bool& changed)
            {
                m_out     = &out;
                m_changed = &changed;

                auto started = Begin(root);
                if (!started)
                    return started;
                while (!m_stack.empty())
                {
                    Frame&     frame    = m_stack.back();
                    const auto children = frame.view.Children();
                    if (frame.next < children.size())
                    {
                        auto mapped = Begin(children[frame.next++]);
                        if (!mapped)
                            return mapped;
                        continue;
                    }
                    auto finished = Finish();
                    if (!finished)
                        return finished;
                }
                return {};
            }

        private:
            /// A kept or unwrapped node whose children are being mapped.
            struct Frame
            {
                Tree::NodeView          view;
                bool                    unwrap {false};
                UIntSize                next {0};
                std::vector<NodeHandle> mapped {};
                bool                    changed {false};
            };

            std::vector<NodeHandle>& Output() noexcept { return m_stack.empty() ? *m_out : m_stack.back().mapped; }
            bool& Changed() noexcept { return m_stack.empty() ? *m_changed : m_stack.back().changed; }

            Expected<void> Begin(NodeHandle handle)
            {
                const Tree::NodeView view = m_source.View(handle);
                auto decision = m_mapper(view, m_dest);
                if (!decision)
                    return std::unexpected(std::move(decision.error()));

                switch (decision->GetKind())
                {
                    case MapResult::Kind::Keep:
                        if (view.ChildCount() == 0)
                        {
                            Output().push_back(handle);
                            return {};
                        }
                        m_stack.push_back(Frame {view});
                        m_stack.back().mapped.reserve(view.ChildCount());
                        return {};
                    case MapResult::Kind::Remove:
                        Changed() = true;
                        return {};
                    case MapResult::Kind::Replace: {
                        const NodeHandle replacement = decision->Handles().front();
                        Output().push_back(replacement);
                        if (replacement != handle)
                            Changed() = true;
                        return {};
                    }
                    case MapResult::Kind::Splice: {
                        const auto handles = decision->Handles();
                        auto&      out     = Output();
                        out.insert(out.end(), handles.begin(), handles.end());
                        Changed() = true;
                        return {};
                    }
                    case MapResult::Kind::Unwrap:
                        Changed() = true;
                        m_stack.push_back(Frame {view, true});
                        return {};
                }
                Unreachable();
            }

            Expected<void> Finish()
            {
                Frame frame = std::move(m_stack.back());
                m_stack.pop_back();

                auto& out = Output();
                if (frame.unwrap)
                {
                    out.insert(out.end(), frame.mapped.begin(), frame.mapped.end());
                    return {};
                }
                if (!frame.changed)
                {
                    out.push_back(frame.view.Handle());
                    return {};
                }

                auto rebuilt = m_dest.Rebuild(frame.view, frame.mapped);
                if (!rebuilt)
                    return std::unexpected(std::move(rebuilt.error()));
                out.push_back(*rebuilt);
                Changed() = true;
                return {};
            }

            HtmlBuilder&             m_dest;
            const Tree::Arena&       m_source;
            const MapFunction&       m_mapper;
            std::vector<Frame>       m_stack;
            std::vector<NodeHandle>* m_out {nullptr};
            bool*                    m_changed {nullptr};
        };
    }// namespace

    bool Visit(const Tree::Arena& arena, NodeHandle root, const VisitFunction& visitor)
    {
        struct Pending
        {
            NodeHandle handle;
            UIntSize   depth;
        };
        std::vector<Pending> pending {Pending {root, 0}};
        while (!pending.empty())
        {
            const Pending next = pending.back();
            pending.pop_back();

            const Tree::NodeView view = arena.View(next.handle);
            switch (visitor(view, next.depth))
            {
                case VisitAction::Stop:
                    return false;
                case VisitAction::SkipChildren:
                    continue;
                case VisitAction::Continue:
                    break;
            }
            const auto children = view.Children();
            for (auto it = children.rbegin(); it != children.rend(); ++it)
                pending.push_back(Pending {*it, next.depth + 1});
        }
        return true;
    }

    std::vector<NodeHandle> CollectElements(const Tree::Arena& arena, NodeHandle root, std::string_view tag)
    {
        std::vector<NodeHandle> found;
        Visit(arena, root, [&](const Tree::NodeView& node, UIntSize) {
            if (node.HasTag(tag))
                found.push_back(node.Handle());
            return VisitAction::Continue;
        });
        return found;
    }

    UIntSize CountNodes(const Tree::Arena& arena, NodeHandle root)
    {
        UIntSize count = 0;
        Visit(arena, root, [&](const Tree::NodeView&, UIntSize) {
            ++count;
            return VisitAction::Continue;
        });
        return count;
    }

    Expected<NodeHandle> Map(HtmlBuilder& dest, const Tree::Arena& source, NodeHandle root, const MapFunction& mapper)
    {
        TreeMapper              treeMapper(dest, source, mapper);
        std::vector<NodeHandle> mapped;
        bool                    changed = false;

        auto result = treeMapper.MapInto(root, mapped, changed);
        if (!result)
            return std::unexpected(std::move(result.error()));
        if (mapped.size() == 1)
            return mapped.front();
        return dest.Fragment(std::span<const NodeHandle>(mapped));
    }

    Expected<NodeHandle> Map(HtmlBuilder& dest, NodeHandle root, const MapFunction& mapper)
    {
        return Map(dest, dest.GetArena(), root, mapper);
    }

    Expected<NodeHandle> Filter(HtmlBuilder& dest, NodeHandle root, const FilterPredicate& keep)
    {
        return Map(dest, root, [&](const Tree::NodeView& node, HtmlBuilder&) -> Expected<MapResult> {
            if (node.Handle() == root || keep(node))
                return MapResult::Keep();
            return MapResult::Remove();
        });
    }

    Expected<NodeHandle> UnwrapElements(HtmlBuilder& dest, NodeHandle root, std::string_view tag, bool strict)
    {
        return Map(dest, root, [&](const Tree::NodeView& node, HtmlBuilder&) -> Expected<MapResult> {
            if (!node.HasTag(tag) || (strict && !node.Attributes().empty()))
                return MapResult::Keep();
            return MapResult::Unwrap();
        });
    }
}// namespace Arbor::Html
