#include <Arbor/Html/Serializer.hpp>

#include <format>
#include <vector>

namespace Arbor::Html
{
    namespace
    {
        /// Depth-first writer with an explicit stack, so deep trees cannot overflow the call stack.
        class HtmlWriter
        {
        public:
            HtmlWriter(std::string& out, const Tree::Arena& arena) noexcept
                : m_out(out), m_arena(arena)
            {
            }

            void Write(Tree::NodeHandle root)
            {
                m_stack.push_back(Step {root, nullptr});
                while (!m_stack.empty())
                {
                    const Step step = m_stack.back();
                    m_stack.pop_back();
                    if (step.close)
                    {
                        m_out += "</";
                        m_out += step.close->name;
                        m_out += '>';
                        continue;
                    }
                    Emit(m_arena.View(step.node));
                }
            }

        private:
            struct Step
            {
                Tree::NodeHandle       node;
                const Schema::TagMeta* close;
            };

            void Emit(const Tree::NodeView& view)
            {
                switch (view.Kind())
                {
                    case Tree::NodeKind::Text:
                        AppendEscaped(m_out, view.Text());
                        return;
                    case Tree::NodeKind::PreSerialized:
                        m_out += view.Text();
                        return;
                    case Tree::NodeKind::Fragment:
                        PushChildren(view);
                        return;
                    case Tree::NodeKind::Element:
                        break;
                }

                const Schema::TagMeta& tag = *view.Raw().tag;
                m_out += '<';
                m_out += tag.name;
                for (const Tree::Attribute& attribute: view.Attributes())
                {
                    m_out += ' ';
                    m_out += attribute.name;
                    m_out += "=\"";
                    AppendEscaped(m_out, attribute.value);
                    m_out += '"';
                }
                m_out += '>';
                if (tag.hasClosingTag)
                    m_stack.push_back(Step {Tree::NodeHandle {}, &tag});
                PushChildren(view);
            }

            void PushChildren(const Tree::NodeView& view)
            {
                const auto children = view.Children();
                for (auto it = children.rbegin(); it != children.rend(); ++it)
                    m_stack.push_back(Step {*it, nullptr});
            }

            std::string&       m_out;
            const Tree::Arena& m_arena;
            std::vector<Step>  m_stack;
        };
    }// namespace

    void AppendEscaped(std::string& out, std::string_view text)
    {
        UIntSize start = 0;
        for (UIntSize i = 0; i < text.size(); ++i)
        {
            std::string_view replacement;
            switch (text[i])
            {
                case '&': replacement = "&amp;"; break;
                case '<': replacement = "&lt;"; break;
                case '>': replacement = "&gt;"; break;
                case '"': replacement = "&quot;"; break;
                case '\'': replacement = "&#39;"; break;
                default: continue;
            }
            out.append(text.substr(start, i - start));
            out.append(replacement);
            start = i + 1;
        }
        out.append(text.substr(start));
    }

    std::string EscapeHtml(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        AppendEscaped(out, text);
        return out;
    }

    void AppendHtml(std::string& out, const Tree::Arena& arena, Tree::NodeHandle root, const SerializeOptions& options)
    {
        if (options.includeDoctype)
            out += kDoctype;
        HtmlWriter writer(out, arena);
        writer.Write(root);
    }

    std::string ToHtml(const Tree::Arena& arena, Tree::NodeHandle root, const SerializeOptions& options)
    {
        std::string out;
        AppendHtml(out, arena, root, options);
        return out;
    }

    Expected<std::string> ToPlainText(const Tree::Arena& arena, Tree::NodeHandle root)
    {
        std::string                   out;
        std::vector<Tree::NodeHandle> pending {root};
        while (!pending.empty())
        {
            const Tree::NodeView view = arena.View(pending.back());
            pending.pop_back();
            switch (view.Kind())
            {
                case Tree::NodeKind::Text:
                    out += view.Text();
                    break;
                case Tree::NodeKind::PreSerialized:
                    return Fail(ErrorCode::PlainTextUnavailable, view.TagName(), "",
                                std::format("pre-serialized <{}> has no plain-text form", view.TagName()));
                case Tree::NodeKind::Element:
                case Tree::NodeKind::Fragment: {
                    const auto children = view.Children();
                    for (auto it = children.rbegin(); it != children.rend(); ++it)
                        pending.push_back(*it);
                    break;
                }
            }
        }
        return out;
    }

    Expected<std::shared_ptr<const Tree::SerializedFragment>> Preserialize(const Tree::Arena& arena,
                                                                           Tree::NodeHandle element)
    {
        const Tree::NodeView view = arena.View(element);
        if (!view.IsElement())
            return Fail(ErrorCode::NotAnElement, "", Tree::ToString(view.Kind()),
                        std::format("only elements can be pre-serialized, got {}", Tree::ToString(view.Kind())));

        auto fragment   = std::make_shared<Tree::SerializedFragment>();
        fragment->outer = view.Raw().tag;
        AppendHtml(fragment->html, arena, element);
        return std::shared_ptr<const Tree::SerializedFragment>(std::move(fragment));
    }
}// namespace Arbor::Html
