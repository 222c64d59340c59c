/// @file Serializer.hpp
/// @brief Rendering of node trees to HTML text and plain text.
#pragma once

#include <Arbor/Core/Error.hpp>
#include <Arbor/Defines.hpp>
#include <Arbor/Tree/Arena.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace Arbor::Html
{
    struct SerializeOptions
    {
        /// Prefix the output with `<!DOCTYPE html>` and a newline.
        bool includeDoctype {false};
    };

    inline constexpr std::string_view kDoctype = "<!DOCTYPE html>\n";

    /// @brief Append `text` to `out` with & < > " ' replaced by character references.
    ARBOR_API void AppendEscaped(std::string& out, std::string_view text);
    [[nodiscard]] ARBOR_API std::string EscapeHtml(std::string_view text);

    /// @brief Append the HTML of `root` to `out`.
    ///
    /// Text and attribute values are escaped. Pre-serialized nodes are copied
    /// verbatim. Fragments contribute only their children. Void elements get no
    /// closing tag. `root` must be valid in `arena`.
    ARBOR_API void AppendHtml(std::string& out, const Tree::Arena& arena, Tree::NodeHandle root,
                              const SerializeOptions& options = {});

    [[nodiscard]] ARBOR_API std::string ToHtml(const Tree::Arena& arena, Tree::NodeHandle root,
                                               const SerializeOptions& options = {});

    /// @brief Concatenated text content, unescaped.
    ///
    /// Fails with PlainTextUnavailable if the tree contains pre-serialized content.
    [[nodiscard]] ARBOR_API Expected<std::string> ToPlainText(const Tree::Arena& arena, Tree::NodeHandle root);

    /// @brief Render an element once so it can be embedded into many trees.
    ///
    /// Fails with NotAnElement for any other node kind.
    [[nodiscard]] ARBOR_API Expected<std::shared_ptr<const Tree::SerializedFragment>>
    Preserialize(const Tree::Arena& arena, Tree::NodeHandle element);
}// namespace Arbor::Html
