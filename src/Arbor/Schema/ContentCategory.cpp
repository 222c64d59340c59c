#include <Arbor/Schema/ContentCategory.hpp>

#include <cctype>

namespace Arbor::Schema
{
    namespace
    {
        constexpr ContentCategory kAllCategories[kContentCategoryCount] = {
                ContentCategory::Metadata,
                ContentCategory::Flow,
                ContentCategory::Sectioning,
                ContentCategory::Heading,
                ContentCategory::Phrasing,
                ContentCategory::Embedded,
                ContentCategory::Interactive,
                ContentCategory::Palpable,
                ContentCategory::ScriptSupporting,
                ContentCategory::Transparent,
                ContentCategory::Text,
        };

        [[nodiscard]] bool EqualsIgnoringSeparators(std::string_view text, std::string_view name) noexcept
        {
            UIntSize j = 0;
            for (const char c: text)
            {
                if (c == '-' || c == '_')
                    continue;
                if (j >= name.size())
                    return false;
                if (std::tolower(static_cast<unsigned char>(c)) != std::tolower(static_cast<unsigned char>(name[j])))
                    return false;
                ++j;
            }
            return j == name.size();
        }
    }// namespace

    std::string_view ToString(ContentCategory category) noexcept
    {
        switch (category)
        {
            case ContentCategory::Metadata:
                return "Metadata";
            case ContentCategory::Flow:
                return "Flow";
            case ContentCategory::Sectioning:
                return "Sectioning";
            case ContentCategory::Heading:
                return "Heading";
            case ContentCategory::Phrasing:
                return "Phrasing";
            case ContentCategory::Embedded:
                return "Embedded";
            case ContentCategory::Interactive:
                return "Interactive";
            case ContentCategory::Palpable:
                return "Palpable";
            case ContentCategory::ScriptSupporting:
                return "ScriptSupporting";
            case ContentCategory::Transparent:
                return "Transparent";
            case ContentCategory::Text:
                return "Text";
        }
        return "Unknown";
    }

    std::optional<ContentCategory> ParseContentCategory(std::string_view text) noexcept
    {
        for (const ContentCategory category: kAllCategories)
        {
            if (EqualsIgnoringSeparators(text, ToString(category)))
                return category;
        }
        return std::nullopt;
    }

    std::string FormatCategories(CategorySet set)
    {
        std::string out;
        for (const ContentCategory category: kAllCategories)
        {
            if (!set.Contains(category))
                continue;
            if (!out.empty())
                out += ", ";
            out += ToString(category);
        }
        return out;
    }
}// namespace Arbor::Schema
