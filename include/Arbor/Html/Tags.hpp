/// @file Tags.hpp
/// @brief The list of HTML tags that get a dedicated HtmlBuilder method.
#pragma once

#include <Arbor/Primitives.hpp>

// X(Method, "tag")
#define ARBOR_HTML_TAGS(X) \
    X(A, "a") \
    X(Abbr, "abbr") \
    X(Address, "address") \
    X(Area, "area") \
    X(Article, "article") \
    X(Aside, "aside") \
    X(Audio, "audio") \
    X(B, "b") \
    X(Base, "base") \
    X(Bdi, "bdi") \
    X(Bdo, "bdo") \
    X(Blockquote, "blockquote") \
    X(Body, "body") \
    X(Br, "br") \
    X(Button, "button") \
    X(Canvas, "canvas") \
    X(Caption, "caption") \
    X(Cite, "cite") \
    X(Code, "code") \
    X(Col, "col") \
    X(Colgroup, "colgroup") \
    X(Data, "data") \
    X(Datalist, "datalist") \
    X(Dd, "dd") \
    X(Del, "del") \
    X(Details, "details") \
    X(Dfn, "dfn") \
    X(Dialog, "dialog") \
    X(Div, "div") \
    X(Dl, "dl") \
    X(Dt, "dt") \
    X(Em, "em") \
    X(Embed, "embed") \
    X(Fieldset, "fieldset") \
    X(Figcaption, "figcaption") \
    X(Figure, "figure") \
    X(Footer, "footer") \
    X(Form, "form") \
    X(H1, "h1") \
    X(H2, "h2") \
    X(H3, "h3") \
    X(H4, "h4") \
    X(H5, "h5") \
    X(H6, "h6") \
    X(Head, "head") \
    X(Header, "header") \
    X(Hgroup, "hgroup") \
    X(Hr, "hr") \
    X(Html, "html") \
    X(I, "i") \
    X(Iframe, "iframe") \
    X(Img, "img") \
    X(Input, "input") \
    X(Ins, "ins") \
    X(Kbd, "kbd") \
    X(Label, "label") \
    X(Legend, "legend") \
    X(Li, "li") \
    X(Link, "link") \
    X(Main, "main") \
    X(Map, "map") \
    X(Mark, "mark") \
    X(Menu, "menu") \
    X(Meta, "meta") \
    X(Meter, "meter") \
    X(Nav, "nav") \
    X(Noscript, "noscript") \
    X(Object, "object") \
    X(Ol, "ol") \
    X(Optgroup, "optgroup") \
    X(Option, "option") \
    X(Output, "output") \
    X(P, "p") \
    X(Picture, "picture") \
    X(Pre, "pre") \
    X(Progress, "progress") \
    X(Q, "q") \
    X(Rp, "rp") \
    X(Rt, "rt") \
    X(Ruby, "ruby") \
    X(S, "s") \
    X(Samp, "samp") \
    X(Script, "script") \
    X(Search, "search") \
    X(Section, "section") \
    X(Select, "select") \
    X(Slot, "slot") \
    X(Small, "small") \
    X(Source, "source") \
    X(Span, "span") \
    X(Strong, "strong") \
    X(Style, "style") \
    X(Sub, "sub") \
    X(Summary, "summary") \
    X(Sup, "sup") \
    X(Table, "table") \
    X(Tbody, "tbody") \
    X(Td, "td") \
    X(Template, "template") \
    X(Textarea, "textarea") \
    X(Tfoot, "tfoot") \
    X(Th, "th") \
    X(Thead, "thead") \
    X(Time, "time") \
    X(Title, "title") \
    X(Tr, "tr") \
    X(Track, "track") \
    X(U, "u") \
    X(Ul, "ul") \
    X(Var, "var") \
    X(Video, "video") \
    X(Wbr, "wbr")

namespace Arbor::Html
{
    enum class KnownTag : UInt16
    {
#define ARBOR_TAG_ENUM(Method, Name) Method,
        ARBOR_HTML_TAGS(ARBOR_TAG_ENUM)
#undef ARBOR_TAG_ENUM
    };

    inline constexpr const char* kKnownTagNames[] = {
#define ARBOR_TAG_NAME(Method, Name) Name,
            ARBOR_HTML_TAGS(ARBOR_TAG_NAME)
#undef ARBOR_TAG_NAME
    };

    inline constexpr UIntSize kKnownTagCount = sizeof(kKnownTagNames) / sizeof(kKnownTagNames[0]);
}// namespace Arbor::Html
