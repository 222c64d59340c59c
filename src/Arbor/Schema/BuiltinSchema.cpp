#include <Arbor/Schema/SchemaDatabase.hpp>

#include <initializer_list>
#include <string>
#include <vector>

namespace Arbor::Schema
{
    namespace
    {
        using enum ContentCategory;
        using Categories = std::initializer_list<ContentCategory>;
        using Names      = std::initializer_list<const char*>;
        using Attributes = std::initializer_list<AttributeRecord>;

        [[nodiscard]] AttributeRecord Att(const char* name, const char* description = "")
        {
            return AttributeRecord {name, description, AttributeKind::Text};
        }

        [[nodiscard]] AttributeRecord Flag(const char* name, const char* description = "")
        {
            return AttributeRecord {name, description, AttributeKind::Bool};
        }

        [[nodiscard]] AttributeRecord Int(const char* name, const char* description = "")
        {
            return AttributeRecord {name, description, AttributeKind::Integer};
        }

        [[nodiscard]] AttributeRecord Num(const char* name)
        {
            return AttributeRecord {name, "", AttributeKind::Float};
        }

        [[nodiscard]] AttributeRecord Ident(const char* name, const char* identifier)
        {
            return AttributeRecord {name, "", AttributeKind::Identifier, identifier};
        }

        [[nodiscard]] AttributeRecord OneOf(const char* name, Names values)
        {
            AttributeRecord record {name, "", AttributeKind::Enumerable};
            for (const char* value: values)
                record.enumValues.emplace_back(value);
            return record;
        }

        struct TagEntry
        {
            const char* tag;
            Categories  categories;
            Categories  permitted;
            Names       children {};
            Attributes  attributes {};
        };

        void Add(std::vector<TagRecord>& out, const TagEntry& entry, bool closing = true)
        {
            TagRecord record;
            record.tagName       = entry.tag;
            record.hasClosingTag = closing;
            record.categories.assign(entry.categories.begin(), entry.categories.end());
            record.permittedContent.assign(entry.permitted.begin(), entry.permitted.end());
            for (const char* child: entry.children)
                record.permittedChildren.emplace_back(child);
            record.attributes.assign(entry.attributes.begin(), entry.attributes.end());
            out.push_back(std::move(record));
        }

        void AddVoid(std::vector<TagRecord>& out, const TagEntry& entry)
        {
            Add(out, entry, false);
        }

        [[nodiscard]] std::vector<TagRecord> BuildRecords()
        {
            const Categories flowContent     = {Flow, Text};
            const Categories phrasingContent = {Phrasing, Text};
            const Categories transparent     = {Flow, Phrasing, Text};
            const Categories phrasingElement = {Flow, Phrasing, Palpable};
            const Categories block           = {Flow, Palpable};
            const Categories sectioning      = {Flow, Sectioning, Palpable};
            const Categories heading         = {Flow, Heading, Palpable};
            const Categories interactive     = {Flow, Phrasing, Interactive, Palpable};
            const Categories embedded        = {Flow, Phrasing, Embedded, Interactive, Palpable};
            const Categories media           = {Flow, Phrasing, Embedded, Interactive, Palpable, Transparent};
            const Categories scriptOnly      = {ScriptSupporting};

            std::vector<TagRecord> r;
            r.reserve(120);

            // Document and metadata
            Add(r, {"html", {}, {}, {"head", "body"}, {Att("xmlns")}});
            Add(r, {"head", {}, {Metadata}});
            Add(r, {"title", {Metadata}, {Text}});
            AddVoid(r, {"base", {Metadata}, {}, {}, {Att("href"), Att("target")}});
            AddVoid(r, {"link", {Metadata, Flow, Phrasing}, {}, {},
                        {Att("as"), OneOf("crossorigin", {"anonymous", "use-credentials"}), Att("href"), Att("hreflang"),
                         Att("integrity"), Att("media"), Att("referrerpolicy"), Att("rel", "Relationship of the linked resource"),
                         Att("sizes"), Att("type"), Att("blocking"), OneOf("fetchpriority", {"high", "low", "auto"}),
                         Att("imagesizes"), Att("imagesrcset")}});
            AddVoid(r, {"meta", {Metadata, Flow, Phrasing}, {}, {},
                        {Att("charset"), Att("content"), Att("http-equiv"), Att("name"), Att("media")}});
            Add(r, {"style", {Metadata}, {Text}, {}, {Att("media"), Att("blocking")}});
            Add(r, {"script", {Metadata, Flow, Phrasing, ScriptSupporting}, {Text}, {},
                    {Flag("async"), OneOf("crossorigin", {"anonymous", "use-credentials"}), Flag("defer"),
                     Att("integrity"), Flag("nomodule"), Att("referrerpolicy"), Att("src"), Att("type"), Att("blocking"),
                     OneOf("fetchpriority", {"high", "low", "auto"})}});
            Add(r, {"noscript", {Metadata, Flow, Phrasing}, {Metadata, Flow, Phrasing, Text}});
            Add(r, {"template", {Metadata, Flow, Phrasing, ScriptSupporting}, {Metadata, Flow, Phrasing, Text}, {},
                    {OneOf("shadowrootmode", {"open", "closed"})}});

            // Sections
            Add(r, {"body", {}, flowContent});
            Add(r, {"article", sectioning, flowContent});
            Add(r, {"aside", sectioning, flowContent});
            Add(r, {"nav", sectioning, flowContent});
            Add(r, {"section", sectioning, flowContent});
            Add(r, {"h1", heading, phrasingContent});
            Add(r, {"h2", heading, phrasingContent});
            Add(r, {"h3", heading, phrasingContent});
            Add(r, {"h4", heading, phrasingContent});
            Add(r, {"h5", heading, phrasingContent});
            Add(r, {"h6", heading, phrasingContent});
            Add(r, {"hgroup", heading, scriptOnly, {"p", "h1", "h2", "h3", "h4", "h5", "h6"}});
            Add(r, {"header", block, flowContent});
            Add(r, {"footer", block, flowContent});
            Add(r, {"address", block, flowContent});
            Add(r, {"main", block, flowContent});
            Add(r, {"search", block, flowContent});

            // Grouping
            Add(r, {"p", block, phrasingContent});
            AddVoid(r, {"hr", {Flow}, {}});
            Add(r, {"pre", block, phrasingContent});
            Add(r, {"blockquote", block, flowContent, {}, {Att("cite")}});
            Add(r, {"ol", block, scriptOnly, {"li"}, {Flag("reversed"), Int("start"), OneOf("type", {"1", "a", "A", "i", "I"})}});
            Add(r, {"ul", block, scriptOnly, {"li"}});
            Add(r, {"menu", block, scriptOnly, {"li"}});
            Add(r, {"li", {}, flowContent, {}, {Int("value", "Ordinal value of the list item")}});
            Add(r, {"dl", block, scriptOnly, {"dt", "dd", "div"}});
            Add(r, {"dt", {}, flowContent});
            Add(r, {"dd", {}, flowContent});
            Add(r, {"figure", block, flowContent, {"figcaption"}});
            Add(r, {"figcaption", {}, flowContent});
            Add(r, {"div", block, flowContent, {"dt", "dd"}});

            // Text-level semantics
            Add(r, {"a", interactive, transparent, {},
                    {Att("download"), Att("href", "The URL that the hyperlink points to"), Att("hreflang"), Att("ping"),
                     Att("referrerpolicy"), Att("rel"), Ident("target", "NavigableTargetName"), Att("type")}});
            for (const char* tag: {"em", "strong", "small", "s", "cite", "dfn", "abbr", "code", "var", "samp", "kbd",
                                   "sub", "sup", "i", "b", "u", "mark", "bdi", "bdo", "span"})
                Add(r, {tag, phrasingElement, phrasingContent});
            Add(r, {"q", phrasingElement, phrasingContent, {}, {Att("cite")}});
            Add(r, {"data", phrasingElement, phrasingContent, {}, {Att("value")}});
            Add(r, {"time", phrasingElement, phrasingContent, {}, {Att("datetime")}});
            Add(r, {"ruby", phrasingElement, phrasingContent, {"rp", "rt"}});
            Add(r, {"rt", {}, phrasingContent});
            Add(r, {"rp", {}, phrasingContent});
            AddVoid(r, {"br", {Flow, Phrasing}, {}});
            AddVoid(r, {"wbr", {Flow, Phrasing}, {}});
            Add(r, {"ins", {Flow, Phrasing, Palpable, Transparent}, transparent, {}, {Att("cite"), Att("datetime")}});
            Add(r, {"del", {Flow, Phrasing, Palpable, Transparent}, transparent, {}, {Att("cite"), Att("datetime")}});

            // Embedded content
            Add(r, {"picture", {Flow, Phrasing, Embedded}, scriptOnly, {"source", "img"}});
            AddVoid(r, {"source", {}, {}, {},
                        {Att("type"), Att("src"), Att("srcset"), Att("sizes"), Att("media"), Int("width"), Int("height")}});
            AddVoid(r, {"img", embedded, {}, {},
                        {Att("alt"), OneOf("crossorigin", {"anonymous", "use-credentials"}),
                         OneOf("decoding", {"sync", "async", "auto"}), OneOf("fetchpriority", {"high", "low", "auto"}),
                         Int("height"), Flag("ismap"), OneOf("loading", {"eager", "lazy"}), Att("referrerpolicy"),
                         Att("sizes"), Att("src"), Att("srcset"), Att("usemap"), Int("width")}});
            Add(r, {"iframe", embedded, {}, {},
                    {Att("allow"), Flag("allowfullscreen"), Int("height"), OneOf("loading", {"eager", "lazy"}),
                     Att("name"), Att("referrerpolicy"), Att("sandbox"), Att("src"), Att("srcdoc"), Int("width")}});
            AddVoid(r, {"embed", embedded, {}, {}, {Int("height"), Att("src"), Att("type"), Int("width")}});
            Add(r, {"object", media, transparent, {},
                    {Att("data"), Att("form"), Int("height"), Att("name"), Att("type"), Int("width")}});
            Add(r, {"video", media, transparent, {"source", "track"},
                    {Flag("autoplay"), Flag("controls"), OneOf("crossorigin", {"anonymous", "use-credentials"}),
                     Int("height"), Flag("loop"), Flag("muted"), Flag("playsinline"), Att("poster"),
                     OneOf("preload", {"none", "metadata", "auto"}), Att("src"), Int("width")}});
            Add(r, {"audio", media, transparent, {"source", "track"},
                    {Flag("autoplay"), Flag("controls"), OneOf("crossorigin", {"anonymous", "use-credentials"}),
                     Flag("loop"), Flag("muted"), OneOf("preload", {"none", "metadata", "auto"}), Att("src")}});
            AddVoid(r, {"track", {}, {}, {},
                        {Flag("default"), OneOf("kind", {"subtitles", "captions", "descriptions", "chapters", "metadata"}),
                         Att("label"), Att("src"), Att("srclang")}});
            Add(r, {"map", {Flow, Phrasing, Palpable, Transparent}, transparent, {"area"}, {Att("name")}});
            AddVoid(r, {"area", {}, {}, {},
                        {Att("alt"), Att("coords"), Att("download"), Att("href"), Att("ping"), Att("referrerpolicy"),
                         Att("rel"), OneOf("shape", {"circle", "default", "poly", "rect"}), Att("target")}});
            Add(r, {"canvas", {Flow, Phrasing, Embedded, Palpable, Transparent}, transparent, {}, {Int("height"), Int("width")}});
            Add(r, {"slot", {Flow, Phrasing, Transparent}, transparent, {}, {Att("name")}});

            // Tabular data
            Add(r, {"table", block, scriptOnly, {"caption", "colgroup", "thead", "tbody", "tfoot", "tr"}});
            Add(r, {"caption", {}, flowContent});
            Add(r, {"colgroup", {}, {}, {"col", "template"}, {Int("span")}});
            AddVoid(r, {"col", {}, {}, {}, {Int("span")}});
            Add(r, {"thead", {}, scriptOnly, {"tr"}});
            Add(r, {"tbody", {}, scriptOnly, {"tr"}});
            Add(r, {"tfoot", {}, scriptOnly, {"tr"}});
            Add(r, {"tr", {}, scriptOnly, {"td", "th"}});
            Add(r, {"td", {}, flowContent, {}, {Int("colspan"), Att("headers"), Int("rowspan")}});
            Add(r, {"th", {}, flowContent, {},
                    {Att("abbr"), Int("colspan"), Att("headers"), Int("rowspan"),
                     OneOf("scope", {"row", "col", "rowgroup", "colgroup"})}});

            // Forms
            Add(r, {"form", block, flowContent, {},
                    {Att("accept-charset"), Att("action"), OneOf("autocomplete", {"on", "off"}), Att("enctype"),
                     OneOf("method", {"get", "post", "dialog"}), Att("name"), Flag("novalidate"), Att("rel"),
                     Att("target")}});
            Add(r, {"label", interactive, phrasingContent, {}, {Att("for")}});
            AddVoid(r, {"input", interactive, {}, {},
                        {Att("accept"), Att("alt"), Att("autocomplete"), Flag("checked"), Att("dirname"), Flag("disabled"),
                         Att("form"), Att("formaction"), Att("formenctype"), Att("formmethod"), Flag("formnovalidate"),
                         Att("formtarget"), Int("height"), Att("list"), Att("max"), Int("maxlength"), Att("min"),
                         Int("minlength"), Flag("multiple"), Att("name"), Att("pattern"), Att("placeholder"),
                         Att("popovertarget"), Flag("readonly"), Flag("required"), Int("size"), Att("src"), Num("step"),
                         Att("type"), Att("value"), Int("width")}});
            Add(r, {"button", interactive, phrasingContent, {},
                    {Flag("disabled"), Att("form"), Att("formaction"), Att("formenctype"), Att("formmethod"),
                     Flag("formnovalidate"), Att("formtarget"), Att("name"), Att("popovertarget"),
                     OneOf("type", {"submit", "reset", "button"}), Att("value")}});
            Add(r, {"select", interactive, scriptOnly, {"option", "optgroup", "hr"},
                    {Att("autocomplete"), Flag("disabled"), Att("form"), Flag("multiple"), Att("name"), Flag("required"),
                     Int("size")}});
            Add(r, {"datalist", {Flow, Phrasing}, {Phrasing, ScriptSupporting, Text}, {"option"}});
            Add(r, {"optgroup", {}, scriptOnly, {"option"}, {Flag("disabled"), Att("label")}});
            Add(r, {"option", {}, {Text}, {}, {Flag("disabled"), Att("label"), Flag("selected"), Att("value")}});
            Add(r, {"textarea", interactive, {Text}, {},
                    {Att("autocomplete"), Int("cols"), Att("dirname"), Flag("disabled"), Att("form"), Int("maxlength"),
                     Int("minlength"), Att("name"), Att("placeholder"), Flag("readonly"), Flag("required"), Int("rows"),
                     OneOf("wrap", {"hard", "soft", "off"})}});
            Add(r, {"output", phrasingElement, phrasingContent, {}, {Att("for"), Att("form"), Att("name")}});
            Add(r, {"progress", phrasingElement, phrasingContent, {}, {Num("max"), Num("value")}});
            Add(r, {"meter", phrasingElement, phrasingContent, {},
                    {Num("high"), Num("low"), Num("max"), Num("min"), Num("optimum"), Num("value")}});
            Add(r, {"fieldset", block, flowContent, {"legend"}, {Flag("disabled"), Att("form"), Att("name")}});
            Add(r, {"legend", {}, {Phrasing, Heading, Text}});

            // Interactive elements
            Add(r, {"details", {Flow, Interactive, Palpable}, flowContent, {"summary"}, {Flag("open"), Att("name")}});
            Add(r, {"summary", {}, {Phrasing, Heading, Text}});
            Add(r, {"dialog", {Flow}, flowContent, {}, {Flag("open")}});

            return r;
        }
    }// namespace

    std::span<const TagRecord> BuiltinTagRecords()
    {
        static const std::vector<TagRecord> records = BuildRecords();
        return records;
    }
}// namespace Arbor::Schema
