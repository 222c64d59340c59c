#include <Arbor/Core/Error.hpp>

#include <format>

namespace Arbor
{
    std::string_view ToString(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::UnknownTag:
                return "UnknownTag";
            case ErrorCode::DisallowedAttribute:
                return "DisallowedAttribute";
            case ErrorCode::DisallowedChild:
                return "DisallowedChild";
            case ErrorCode::InvalidHandle:
                return "InvalidHandle";
            case ErrorCode::DuplicateAttribute:
                return "DuplicateAttribute";
            case ErrorCode::CapacityExceeded:
                return "CapacityExceeded";
            case ErrorCode::NotAnElement:
                return "NotAnElement";
            case ErrorCode::PlainTextUnavailable:
                return "PlainTextUnavailable";
            case ErrorCode::DependencyCycle:
                return "DependencyCycle";
            case ErrorCode::InvalidSchema:
                return "InvalidSchema";
            case ErrorCode::SchemaParse:
                return "SchemaParse";
            case ErrorCode::SchemaIO:
                return "SchemaIO";
        }
        return "Unknown";
    }

    Error MakeError(ErrorCode code, std::string_view tag, std::string_view subject, std::string message)
    {
        Error err;
        err.code    = code;
        err.tag     = std::string(tag);
        err.subject = std::string(subject);
        err.message = std::move(message);
        return err;
    }

    std::string Describe(const Error& error)
    {
        if (error.HasIndex())
            return std::format("{}: {} (child {})", ToString(error.code), error.message, error.index);
        return std::format("{}: {}", ToString(error.code), error.message);
    }
}// namespace Arbor
