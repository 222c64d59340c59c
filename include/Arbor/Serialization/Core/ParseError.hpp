/// @file ParseError.hpp
/// @brief Failure report shared by the text readers.
#pragma once

#include <Arbor/Defines.hpp>
#include <Arbor/Primitives.hpp>

#include <string>
#include <string_view>

namespace Arbor::Serialization
{
    enum class ParseErrorCode : UInt8
    {
        UnexpectedEnd,
        UnexpectedCharacter,
        InvalidToken,
        InvalidNumber,
        InvalidStringEscape,
        InvalidUnicodeEscape,
        DepthExceeded,
        TrailingCharacters,
        HandlerRejected,
    };

    /// Line and column are 1-based. Columns count bytes, not code points.
    struct ParseLocation
    {
        UIntSize offset {0};
        UIntSize line {1};
        UIntSize column {1};
    };

    struct ParseError
    {
        ParseErrorCode code {ParseErrorCode::InvalidToken};
        ParseLocation  location {};
        std::string    message {};
    };

    [[nodiscard]] ARBOR_API std::string_view ToString(ParseErrorCode code) noexcept;

    /// @brief `message at line L, column C`.
    [[nodiscard]] ARBOR_API std::string Describe(const ParseError& error);
}// namespace Arbor::Serialization
