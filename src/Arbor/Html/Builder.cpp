#include <Arbor/Html/Builder.hpp>

#include <Arbor/Config.hpp>
#include <Arbor/Diagnostics/Contract.hpp>
#include <Arbor/Diagnostics/Log.hpp>

#include <format>

namespace Arbor::Html
{
    namespace
    {
        constexpr std::string_view kNbsp = "\xC2\xA0";

        [[nodiscard]] std::unexpected<Error> WithIndex(Error err, std::string_view parent, UIntSize index)
        {
            if (err.tag.empty())
                err.tag = parent;
            err.index = index;
            return std::unexpected(std::move(err));
        }
    }// namespace

    HtmlBuilder::HtmlBuilder(Tree::Arena& arena, const Schema::SchemaDatabase& schema, BuilderOptions options)
        : m_arena(&arena), m_schema(&schema), m_options(options)
    {
        for (UIntSize i = 0; i < kKnownTagCount; ++i)
            m_known[i] = schema.Find(kKnownTagNames[i]);
    }

    Expected<NodeHandle> HtmlBuilder::Element(std::string_view tag, Attributes attributes, Children children,
                                              const std::source_location& location)
    {
        auto meta = m_schema->Lookup(tag);
        if (!meta)
            return std::unexpected(std::move(meta.error()));
        return Element(**meta, std::span<const AttributeArg>(attributes.begin(), attributes.size()),
                       std::span<const Child>(children.begin(), children.size()), location);
    }

    Expected<NodeHandle> HtmlBuilder::Element(KnownTag tag, Attributes attributes, Children children,
                                              const std::source_location& location)
    {
        const UIntSize index = static_cast<UIntSize>(tag);
        const Schema::TagMeta* meta = m_known[index];
        if (!meta)
            return Fail(ErrorCode::UnknownTag, kKnownTagNames[index], "",
                        std::format("<{}> is not defined by the active schema", kKnownTagNames[index]));
        return Element(*meta, std::span<const AttributeArg>(attributes.begin(), attributes.size()),
                       std::span<const Child>(children.begin(), children.size()), location);
    }

    Expected<NodeHandle> HtmlBuilder::Element(const Schema::TagMeta& tag, std::span<const AttributeArg> attributes,
                                              std::span<const Child> children, const std::source_location& location)
    {
        std::vector<Tree::Attribute> attrs;
        attrs.reserve(attributes.size() + 1);
        for (const AttributeArg& attribute: attributes)
        {
            if (!attribute.IsPresent())
                continue;
            if (m_options.validate)
            {
                auto allowed = m_schema->ValidateAttribute(tag, attribute.Name());
                if (!allowed)
                    return std::unexpected(std::move(allowed.error()));
            }
            attrs.push_back({attribute.Name(), attribute.Value()});
        }

        std::vector<NodeHandle> handles;
        auto collected = CollectChildren(children, handles);
        if (!collected)
            return std::unexpected(std::move(collected.error()));

        if (m_options.validate)
        {
            auto valid = ValidateChildren(tag, handles);
            if (!valid)
                return std::unexpected(std::move(valid.error()));
        }

        std::string trace;
        if (m_options.traceConstruction)
        {
            bool hasTitle = false;
            for (const auto& attribute: attrs)
                hasTitle = hasTitle || attribute.name == ARBOR_TRACE_ATTRIBUTE;
            if (hasTitle)
            {
                Diagnostics::Log(Diagnostics::LogLevel::Warning, "HtmlBuilder",
                                 "<{}> at {}:{} already has a '{}' attribute; construction site not recorded",
                                 tag.name, location.file_name(), location.line(), ARBOR_TRACE_ATTRIBUTE);
            }
            else
            {
                trace = std::format("Generated at:\n {}:{} ({})", location.file_name(), location.line(),
                                    location.function_name());
                attrs.push_back({ARBOR_TRACE_ATTRIBUTE, trace});
            }
        }

        return m_arena->Allocate(Tree::Node::MakeElement(tag, attrs, handles));
    }

    Expected<void> HtmlBuilder::CollectChildren(std::span<const Child> children, std::vector<NodeHandle>& out) const
    {
        for (const Child& child: children)
        {
            if (const Error* failure = child.Failure())
                return std::unexpected(*failure);
            const auto handles = child.Handles();
            out.insert(out.end(), handles.begin(), handles.end());
        }
        return {};
    }

    Expected<void> HtmlBuilder::ValidateChildren(const Schema::TagMeta& parent,
                                                 std::span<const NodeHandle> children) const
    {
        for (UIntSize i = 0; i < children.size(); ++i)
        {
            auto view = m_arena->TryResolve(children[i]);
            if (!view)
            {
                // A stale or foreign handle is a caller bug, not bad input.
                Diagnostics::Log(Diagnostics::LogLevel::Error, "HtmlBuilder", "<{}> child {}: {}", parent.name, i,
                                 view.error().message);
                return WithIndex(std::move(view.error()), parent.name, i);
            }
            auto valid = ValidateChild(parent, *view);
            if (!valid)
                return WithIndex(std::move(valid.error()), parent.name, i);
        }
        return {};
    }

    Expected<void> HtmlBuilder::ValidateChild(const Schema::TagMeta& parent, const Tree::NodeView& child) const
    {
        switch (child.Kind())
        {
            case Tree::NodeKind::Element:
            case Tree::NodeKind::PreSerialized: {
                const Schema::TagMeta* tag = child.Tag();
                if (!tag)
                    return {};
                return m_schema->ValidateChildElement(parent, *tag);
            }
            case Tree::NodeKind::Text:
                return m_schema->ValidateText(parent, child.Text());
            case Tree::NodeKind::Fragment:
                // Fragments vanish when rendered, so their children must fit the parent.
                for (const NodeHandle grandchild: child.Children())
                {
                    auto valid = ValidateChild(parent, m_arena->View(grandchild));
                    if (!valid)
                        return valid;
                }
                return {};
        }
        Unreachable();
    }

    Expected<NodeHandle> HtmlBuilder::Text(std::string_view text)
    {
        return m_arena->AllocateText(text);
    }

    Expected<NodeHandle> HtmlBuilder::OptText(std::optional<std::string_view> text)
    {
        if (!text)
            return Empty();
        return Text(*text);
    }

    Expected<NodeHandle> HtmlBuilder::Nbsp()
    {
        return Text(kNbsp);
    }

    Expected<NodeHandle> HtmlBuilder::Fragment(Children children)
    {
        std::vector<NodeHandle> handles;
        auto collected = CollectChildren(std::span<const Child>(children.begin(), children.size()), handles);
        if (!collected)
            return std::unexpected(std::move(collected.error()));
        return m_arena->AllocateFragment(handles);
    }

    Expected<NodeHandle> HtmlBuilder::Fragment(std::span<const NodeHandle> children)
    {
        return m_arena->AllocateFragment(children);
    }

    Expected<NodeHandle> HtmlBuilder::Empty()
    {
        return m_arena->AllocateFragment({});
    }

    Expected<NodeHandle> HtmlBuilder::PreSerialized(std::shared_ptr<const Tree::SerializedFragment> fragment)
    {
        if (!fragment)
            Diagnostics::ContractViolation("HtmlBuilder::PreSerialized: null fragment");
        return m_arena->AllocatePreSerialized(std::move(fragment));
    }

    Expected<NodeHandle> HtmlBuilder::Graft(std::shared_ptr<const Tree::Arena> source, NodeHandle root)
    {
        if (!source)
            Diagnostics::ContractViolation("HtmlBuilder::Graft: null arena");
        if (!source->IsValid(root))
            return Fail(ErrorCode::InvalidHandle, "", "",
                        std::format("graft root {} is not valid in its source arena", root.Slot()));
        auto adopted = m_arena->Adopt(std::move(source));
        if (!adopted)
            return std::unexpected(std::move(adopted.error()));
        return root;
    }

    Expected<NodeHandle> HtmlBuilder::Rebuild(const Tree::NodeView& original, std::span<const NodeHandle> children)
    {
        switch (original.Kind())
        {
            case Tree::NodeKind::Element: {
                const Schema::TagMeta& tag = *original.Raw().tag;
                if (m_options.validate)
                {
                    auto valid = ValidateChildren(tag, children);
                    if (!valid)
                        return std::unexpected(std::move(valid.error()));
                }
                return m_arena->Allocate(Tree::Node::MakeElement(tag, original.Attributes(), children));
            }
            case Tree::NodeKind::Fragment:
                return m_arena->AllocateFragment(children);
            case Tree::NodeKind::Text:
            case Tree::NodeKind::PreSerialized:
                break;
        }
        return original.Handle();
    }
}// namespace Arbor::Html
