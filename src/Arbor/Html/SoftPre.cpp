#include <Arbor/Html/SoftPre.hpp>

#include <optional>
#include <string>

namespace Arbor::Html
{
    namespace
    {
        constexpr std::string_view kNbsp = "\xC2\xA0";

        [[nodiscard]] bool IsUrlBreak(char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == '<' || c == '>' ||
                   c == '"';
        }

        [[nodiscard]] bool IsTrailingPunctuation(char c) noexcept
        {
            switch (c)
            {
                case '.':
                case ',':
                case ';':
                case ':':
                case '!':
                case '?':
                case ')':
                case '\'':
                case '"':
                    return true;
                default:
                    return false;
            }
        }

        [[nodiscard]] UIntSize FindUrlStart(std::string_view text, UIntSize from) noexcept
        {
            const UIntSize http  = text.find("http://", from);
            const UIntSize https = text.find("https://", from);
            return http < https ? http : https;
        }

        [[nodiscard]] UIntSize SchemeLength(std::string_view text, UIntSize start) noexcept
        {
            return text.substr(start, 8) == "https://" ? 8 : 7;
        }

        Expected<void> AppendText(HtmlBuilder& builder, std::string_view text, std::vector<NodeHandle>& out)
        {
            if (text.empty())
                return {};
            auto node = builder.Text(text);
            if (!node)
                return std::unexpected(std::move(node.error()));
            out.push_back(*node);
            return {};
        }

        Expected<void> AppendPlain(HtmlBuilder& builder, std::string_view text, std::optional<UInt8> tabsToNbsp,
                                   std::vector<NodeHandle>& out)
        {
            if (!tabsToNbsp || text.find('\t') == std::string_view::npos)
                return AppendText(builder, text, out);

            std::string expanded;
            expanded.reserve(text.size() + 16);
            for (const char c: text)
            {
                if (c != '\t')
                {
                    expanded += c;
                    continue;
                }
                for (UInt8 i = 0; i < *tabsToNbsp; ++i)
                    expanded += kNbsp;
            }
            return AppendText(builder, expanded, out);
        }

        /// Links are found in the raw text; tabs are expanded only in the text between them.
        Expected<void> LinkInto(HtmlBuilder& builder, std::string_view text, std::optional<UInt8> tabsToNbsp,
                                std::vector<NodeHandle>& out)
        {
            UIntSize position = 0;
            while (position < text.size())
            {
                const UIntSize start = FindUrlStart(text, position);
                if (start == std::string_view::npos)
                    break;

                UIntSize end = start;
                while (end < text.size() && !IsUrlBreak(text[end]))
                    ++end;
                while (end > start && IsTrailingPunctuation(text[end - 1]))
                    --end;

                const UIntSize schemeEnd = start + SchemeLength(text, start);
                if (end <= schemeEnd)
                {
                    // A bare scheme is not a link.
                    auto plain = AppendPlain(builder, text.substr(position, schemeEnd - position), tabsToNbsp, out);
                    if (!plain)
                        return plain;
                    position = schemeEnd;
                    continue;
                }

                auto before = AppendPlain(builder, text.substr(position, start - position), tabsToNbsp, out);
                if (!before)
                    return before;

                const std::string_view url = text.substr(start, end - start);
                auto link = builder.A({{"href", url}}, {builder.Text(url)});
                if (!link)
                    return std::unexpected(std::move(link.error()));
                out.push_back(*link);
                position = end;
            }
            return AppendPlain(builder, text.substr(position), tabsToNbsp, out);
        }

        Expected<void> AppendLine(HtmlBuilder& builder, std::string_view line, const SoftPreOptions& options,
                                  std::vector<NodeHandle>& out)
        {
            if (!options.autolink)
                return AppendPlain(builder, line, options.tabsToNbsp, out);
            return LinkInto(builder, line, options.tabsToNbsp, out);
        }
    }// namespace

    Expected<std::vector<NodeHandle>> Autolink(HtmlBuilder& builder, std::string_view text)
    {
        std::vector<NodeHandle> nodes;
        auto linked = LinkInto(builder, text, std::nullopt, nodes);
        if (!linked)
            return std::unexpected(std::move(linked.error()));
        return nodes;
    }

    Expected<NodeHandle> SoftPre(HtmlBuilder& builder, std::string_view text, const SoftPreOptions& options)
    {
        std::vector<NodeHandle> body;
        UIntSize                position = 0;
        while (true)
        {
            const UIntSize split = options.lineSeparator.empty() ? std::string_view::npos
                                                                 : text.find(options.lineSeparator, position);
            const std::string_view line =
                    text.substr(position, split == std::string_view::npos ? std::string_view::npos : split - position);

            auto appended = AppendLine(builder, line, options, body);
            if (!appended)
                return std::unexpected(std::move(appended.error()));
            auto br = builder.Br();
            if (!br)
                return std::unexpected(std::move(br.error()));
            body.push_back(*br);

            if (split == std::string_view::npos)
                break;
            position = split + options.lineSeparator.size();
        }
        return builder.Div({{"class", "soft_pre"}}, {body});
    }
}// namespace Arbor::Html
