#include <Arbor/Serialization/Core/ParseError.hpp>

#include <format>

namespace Arbor::Serialization
{
    std::string_view ToString(ParseErrorCode code) noexcept
    {
        switch (code)
        {
            case ParseErrorCode::UnexpectedEnd:
                return "UnexpectedEnd";
            case ParseErrorCode::UnexpectedCharacter:
                return "UnexpectedCharacter";
            case ParseErrorCode::InvalidToken:
                return "InvalidToken";
            case ParseErrorCode::InvalidNumber:
                return "InvalidNumber";
            case ParseErrorCode::InvalidStringEscape:
                return "InvalidStringEscape";
            case ParseErrorCode::InvalidUnicodeEscape:
                return "InvalidUnicodeEscape";
            case ParseErrorCode::DepthExceeded:
                return "DepthExceeded";
            case ParseErrorCode::TrailingCharacters:
                return "TrailingCharacters";
            case ParseErrorCode::HandlerRejected:
                return "HandlerRejected";
        }
        return "Unknown";
    }

    std::string Describe(const ParseError& error)
    {
        return std::format("{} at line {}, column {}", error.message, error.location.line, error.location.column);
    }
}// namespace Arbor::Serialization
