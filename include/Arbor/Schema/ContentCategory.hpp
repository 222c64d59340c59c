/// @file ContentCategory.hpp
/// @brief HTML content categories and a compact set type over them.
#pragma once

#include <Arbor/Defines.hpp>
#include <Arbor/Primitives.hpp>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace Arbor::Schema
{
    /// @brief Content categories an element belongs to or permits as children.
    ///
    /// `Text` is not an HTML category. As a permitted-content entry it means the
    /// element accepts non-whitespace character data.
    enum class ContentCategory : UInt8
    {
        Metadata,
        Flow,
        Sectioning,
        Heading,
        Phrasing,
        Embedded,
        Interactive,
        Palpable,
        ScriptSupporting,
        Transparent,
        Text,
    };

    inline constexpr UIntSize kContentCategoryCount = 11;

    class CategorySet
    {
    public:
        constexpr CategorySet() noexcept = default;

        constexpr CategorySet(std::initializer_list<ContentCategory> categories) noexcept
        {
            for (const ContentCategory category: categories)
                Insert(category);
        }

        constexpr void Insert(ContentCategory category) noexcept
        {
            m_bits = static_cast<UInt16>(m_bits | Bit(category));
        }

        [[nodiscard]] constexpr bool Contains(ContentCategory category) const noexcept
        {
            return (m_bits & Bit(category)) != 0;
        }

        [[nodiscard]] constexpr bool Intersects(CategorySet other) const noexcept
        {
            return (m_bits & other.m_bits) != 0;
        }

        [[nodiscard]] constexpr CategorySet Intersection(CategorySet other) const noexcept
        {
            CategorySet result;
            result.m_bits = static_cast<UInt16>(m_bits & other.m_bits);
            return result;
        }

        [[nodiscard]] constexpr bool IsEmpty() const noexcept { return m_bits == 0; }
        [[nodiscard]] constexpr UInt16 Bits() const noexcept { return m_bits; }

        constexpr bool operator==(const CategorySet&) const noexcept = default;

    private:
        [[nodiscard]] static constexpr UInt16 Bit(ContentCategory category) noexcept
        {
            return static_cast<UInt16>(1u << static_cast<unsigned>(category));
        }

        UInt16 m_bits {0};
    };

    [[nodiscard]] ARBOR_API std::string_view ToString(ContentCategory category) noexcept;

    /// @brief Accepts the enumerator names, case-insensitively, with or without '-' or '_'
    ///        ("ScriptSupporting", "script-supporting").
    [[nodiscard]] ARBOR_API std::optional<ContentCategory> ParseContentCategory(std::string_view text) noexcept;

    /// @brief Comma-separated list of the categories in `set`, in enumeration order.
    [[nodiscard]] ARBOR_API std::string FormatCategories(CategorySet set);
}// namespace Arbor::Schema
