#include <Arbor/Schema/SchemaDatabase.hpp>

#include <Arbor/Diagnostics/Log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <format>
#include <string>

namespace Arbor::Schema
{
    namespace
    {
        // Sorted, for binary search.
        constexpr std::string_view kGlobalAttributes[] = {
                "accesskey", "autocapitalize", "autofocus", "class", "contenteditable", "dir", "draggable",
                "enterkeyhint", "exportparts", "hidden", "id", "inert", "inputmode", "is", "itemid", "itemprop",
                "itemref", "itemscope", "itemtype", "lang", "nonce", "part", "popover", "role", "slot",
                "spellcheck", "style", "tabindex", "title", "translate", "virtualkeyboardpolicy",
        };

        constexpr std::string_view kEventHandlerAttributes[] = {
                "onabort", "onautocomplete", "onautocompleteerror", "onblur", "oncancel", "oncanplay",
                "oncanplaythrough", "onchange", "onclick", "onclose", "oncontextmenu", "oncuechange", "ondblclick",
                "ondrag", "ondragend", "ondragenter", "ondragleave", "ondragover", "ondragstart", "ondrop",
                "ondurationchange", "onemptied", "onended", "onerror", "onfocus", "oninput", "oninvalid",
                "onkeydown", "onkeypress", "onkeyup", "onload", "onloadeddata", "onloadedmetadata", "onloadstart",
                "onmousedown", "onmouseenter", "onmouseleave", "onmousemove", "onmouseout", "onmouseover",
                "onmouseup", "onmousewheel", "onpause", "onplay", "onplaying", "onprogress", "onratechange",
                "onreset", "onresize", "onscroll", "onseeked", "onseeking", "onselect", "onshow", "onsort",
                "onstalled", "onsubmit", "onsuspend", "ontimeupdate", "ontoggle", "onvolumechange", "onwaiting",
        };

        template<std::size_t N>
        [[nodiscard]] bool ContainsSorted(const std::string_view (&names)[N], std::string_view name) noexcept
        {
            return std::binary_search(std::begin(names), std::end(names), name);
        }

        [[nodiscard]] std::string DefaultStructName(std::string_view tagName)
        {
            std::string result(tagName);
            if (!result.empty())
                result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
            return result;
        }

        [[nodiscard]] std::string JoinSorted(std::vector<std::string> names)
        {
            std::sort(names.begin(), names.end());
            names.erase(std::unique(names.begin(), names.end()), names.end());
            std::string out;
            for (const auto& name: names)
            {
                if (!out.empty())
                    out += ", ";
                out += name;
            }
            return out;
        }
    }// namespace

    bool IsWhitespaceOnly(std::string_view text) noexcept
    {
        return std::all_of(text.begin(), text.end(), [](char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
        });
    }

    Expected<SchemaDatabase> SchemaDatabase::FromRecords(std::span<const TagRecord> records)
    {
        SchemaDatabase db;
        db.m_tags.reserve(records.size());

        for (const TagRecord& record: records)
        {
            if (record.tagName.empty())
                return Fail(ErrorCode::InvalidSchema, "", "", "tag record without a tag name");
            if (db.m_tags.size() > 0xFFFF)
                return Fail(ErrorCode::InvalidSchema, record.tagName, "", "too many tags");

            TagMeta meta;
            meta.id                  = static_cast<TagId>(db.m_tags.size());
            meta.name                = record.tagName;
            meta.structName          = record.structName.empty() ? DefaultStructName(record.tagName) : record.structName;
            meta.hasClosingTag       = record.hasClosingTag;
            meta.hasGlobalAttributes = record.hasGlobalAttributes;
            for (const ContentCategory category: record.categories)
                meta.categories.Insert(category);
            for (const ContentCategory category: record.permittedContent)
                meta.permittedContent.Insert(category);

            meta.attributes.reserve(record.attributes.size());
            for (const AttributeRecord& attribute: record.attributes)
            {
                if (attribute.name.empty())
                    return Fail(ErrorCode::InvalidSchema, record.tagName, "", "attribute without a name");
                meta.attributes.push_back(AttributeMeta {attribute.name, attribute.description, attribute.kind,
                                                         attribute.identifier, attribute.enumValues});
            }
            std::sort(meta.attributes.begin(), meta.attributes.end(),
                      [](const AttributeMeta& a, const AttributeMeta& b) { return a.name < b.name; });
            auto duplicate = std::adjacent_find(meta.attributes.begin(), meta.attributes.end(),
                                                [](const AttributeMeta& a, const AttributeMeta& b) { return a.name == b.name; });
            if (duplicate != meta.attributes.end())
                return Fail(ErrorCode::InvalidSchema, record.tagName, duplicate->name,
                            std::format("attribute '{}' declared twice on <{}>", duplicate->name, record.tagName));

            db.m_tags.push_back(std::move(meta));
        }

        db.m_byName.resize(db.m_tags.size());
        for (UIntSize i = 0; i < db.m_tags.size(); ++i)
            db.m_byName[i] = static_cast<TagId>(i);
        std::sort(db.m_byName.begin(), db.m_byName.end(),
                  [&](TagId a, TagId b) { return db.m_tags[a].name < db.m_tags[b].name; });
        for (UIntSize i = 1; i < db.m_byName.size(); ++i)
        {
            const TagMeta& previous = db.m_tags[db.m_byName[i - 1]];
            if (previous.name == db.m_tags[db.m_byName[i]].name)
                return Fail(ErrorCode::InvalidSchema, previous.name, "", std::format("tag <{}> declared twice", previous.name));
        }

        // Permitted children may only be resolved once every tag is known.
        for (UIntSize i = 0; i < records.size(); ++i)
        {
            TagMeta& meta = db.m_tags[i];
            for (const std::string& childName: records[i].permittedChildren)
            {
                if (childName == "Text")
                {
                    meta.permittedContent.Insert(ContentCategory::Text);
                    continue;
                }
                const TagMeta* child = db.Find(childName);
                if (!child)
                {
                    auto byStruct = std::find_if(db.m_tags.begin(), db.m_tags.end(),
                                                 [&](const TagMeta& t) { return t.structName == childName; });
                    if (byStruct != db.m_tags.end())
                        child = &*byStruct;
                }
                if (!child)
                    return Fail(ErrorCode::InvalidSchema, meta.name, childName,
                                std::format("unknown permitted child '{}' of <{}>", childName, meta.name));
                meta.permittedChildren.push_back(child->id);
            }
            std::sort(meta.permittedChildren.begin(), meta.permittedChildren.end());
            meta.permittedChildren.erase(std::unique(meta.permittedChildren.begin(), meta.permittedChildren.end()),
                                         meta.permittedChildren.end());
        }

        Diagnostics::Log(Diagnostics::LogLevel::Debug, "SchemaDatabase", "built schema with {} tags", db.m_tags.size());
        return db;
    }

    const SchemaDatabase& SchemaDatabase::Builtin()
    {
        static const SchemaDatabase instance = [] {
            auto result = FromRecords(BuiltinTagRecords());
            if (!result)
            {
                Diagnostics::Log(Diagnostics::LogLevel::Error, "SchemaDatabase", "built-in schema is invalid: {}",
                                 Describe(result.error()));
                std::abort();
            }
            return std::move(*result);
        }();
        return instance;
    }

    const TagMeta* SchemaDatabase::Find(std::string_view tag) const noexcept
    {
        auto it = std::lower_bound(m_byName.begin(), m_byName.end(), tag,
                                   [&](TagId id, std::string_view name) { return m_tags[id].name < name; });
        if (it == m_byName.end() || m_tags[*it].name != tag)
            return nullptr;
        return &m_tags[*it];
    }

    const TagMeta* SchemaDatabase::FindById(TagId id) const noexcept
    {
        if (id >= m_tags.size())
            return nullptr;
        return &m_tags[id];
    }

    Expected<const TagMeta*> SchemaDatabase::Lookup(std::string_view tag) const
    {
        if (const TagMeta* meta = Find(tag))
            return meta;
        return Fail(ErrorCode::UnknownTag, tag, "", std::format("unknown tag <{}>", tag));
    }

    bool SchemaDatabase::IsGlobalAttribute(std::string_view attribute) noexcept
    {
        if (attribute.starts_with("data-") && attribute.size() > 5)
            return true;
        if (attribute.starts_with("aria-") && attribute.size() > 5)
            return true;
        return ContainsSorted(kGlobalAttributes, attribute) ||
               ContainsSorted(kEventHandlerAttributes, attribute);
    }

    Expected<void> SchemaDatabase::ValidateAttribute(const TagMeta& tag, std::string_view attribute) const
    {
        if (tag.FindAttribute(attribute))
            return {};
        if (tag.hasGlobalAttributes && IsGlobalAttribute(attribute))
            return {};

        std::vector<std::string> allowed;
        allowed.reserve(tag.attributes.size());
        for (const AttributeMeta& meta: tag.attributes)
            allowed.push_back(meta.name);
        std::string list = JoinSorted(std::move(allowed));
        if (tag.hasGlobalAttributes)
            list = list.empty() ? "global attributes" : list + ", and global attributes";
        else if (list.empty())
            list = "none";
        return Fail(ErrorCode::DisallowedAttribute, tag.name, attribute,
                    std::format("attribute '{}' is not allowed on <{}>; allowed: {}", attribute, tag.name, list));
    }

    Expected<void> SchemaDatabase::ValidateAttribute(std::string_view tag, std::string_view attribute) const
    {
        auto meta = Lookup(tag);
        if (!meta)
            return std::unexpected(std::move(meta.error()));
        return ValidateAttribute(**meta, attribute);
    }

    Expected<void> SchemaDatabase::ValidateChild(const TagMeta& parent, ContentCategory category) const
    {
        if (parent.permittedContent.Contains(category))
            return {};
        const std::string permitted = FormatCategories(parent.permittedContent);
        return Fail(ErrorCode::DisallowedChild, parent.name, ToString(category),
                    std::format("{} content is not allowed inside <{}>; permitted categories: {}", ToString(category),
                                parent.name, permitted.empty() ? "none" : permitted));
    }

    Expected<void> SchemaDatabase::ValidateChild(std::string_view parent, ContentCategory category) const
    {
        auto meta = Lookup(parent);
        if (!meta)
            return std::unexpected(std::move(meta.error()));
        return ValidateChild(**meta, category);
    }

    Expected<void> SchemaDatabase::ValidateChildElement(const TagMeta& parent, const TagMeta& child) const
    {
        if (parent.PermitsChildTag(child.id))
            return {};
        if (parent.permittedContent.Intersects(child.categories))
            return {};

        std::vector<std::string> allowed;
        for (const TagId id: parent.permittedChildren)
            allowed.push_back(m_tags[id].name);
        std::string list = JoinSorted(std::move(allowed));
        const std::string categories = FormatCategories(parent.permittedContent);
        if (!categories.empty())
            list = list.empty() ? categories + " content" : list + "; " + categories + " content";
        return Fail(ErrorCode::DisallowedChild, parent.name, child.name,
                    std::format("<{}> is not allowed inside <{}>; allowed: {}", child.name, parent.name,
                                list.empty() ? "nothing" : list));
    }

    Expected<void> SchemaDatabase::ValidateText(const TagMeta& parent, std::string_view text) const
    {
        if (parent.AllowsText() || IsWhitespaceOnly(text))
            return {};
        return ValidateChild(parent, ContentCategory::Text);
    }
}// namespace Arbor::Schema
