/// @file SoftPre.hpp
/// @brief Plain text rendered like `<pre>` but still wrapping at the window edge.
#pragma once

#include <Arbor/Core/Error.hpp>
#include <Arbor/Defines.hpp>
#include <Arbor/Html/Builder.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace Arbor::Html
{
    struct SoftPreOptions
    {
        /// Replace each tab with this many non-breaking spaces. Tabs are kept when empty.
        std::optional<UInt8> tabsToNbsp {8};
        /// Turn http:// and https:// URLs into links.
        bool autolink {true};
        /// Lines are split on this string. An empty separator keeps the text on one line.
        std::string_view lineSeparator {"\n"};
    };

    /// @brief Text and `<a href>` nodes for `text`, with every http(s) URL linked.
    ///
    /// A URL runs up to the next whitespace; trailing `.,;:!?)'"` are left outside the link.
    [[nodiscard]] ARBOR_API Expected<std::vector<NodeHandle>> Autolink(HtmlBuilder& builder, std::string_view text);

    /// @brief `<div class="soft_pre">` holding each line of `text` followed by `<br>`.
    [[nodiscard]] ARBOR_API Expected<NodeHandle> SoftPre(HtmlBuilder& builder, std::string_view text,
                                                         const SoftPreOptions& options = {});
}// namespace Arbor::Html
