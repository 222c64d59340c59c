/// @file Error.hpp
/// @brief Error codes and expected type used across tree construction and validation.
#pragma once

#include <Arbor/Defines.hpp>
#include <Arbor/Primitives.hpp>

#include <expected>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

namespace Arbor
{
    enum class ErrorCode : UInt8
    {
        UnknownTag,
        DisallowedAttribute,
        DisallowedChild,
        InvalidHandle,
        DuplicateAttribute,
        CapacityExceeded,
        NotAnElement,
        PlainTextUnavailable,
        DependencyCycle,
        InvalidSchema,
        SchemaParse,
        SchemaIO,
    };

    /// @brief Error value identifying what was rejected and where.
    struct Error
    {
        static constexpr UIntSize kNoIndex = std::numeric_limits<UIntSize>::max();

        ErrorCode   code {ErrorCode::InvalidHandle};
        std::string tag {};    ///< Tag being built or validated, if any.
        std::string subject {};///< Offending attribute name, child tag or category.
        UIntSize    index {kNoIndex};///< Position of the offending child.
        std::string message {};

        [[nodiscard]] bool HasIndex() const noexcept { return index != kNoIndex; }
    };

    template<typename T>
    using Expected = std::expected<T, Error>;

    [[nodiscard]] ARBOR_API std::string_view ToString(ErrorCode code) noexcept;

    [[nodiscard]] ARBOR_API Error MakeError(ErrorCode code, std::string_view tag, std::string_view subject,
                                            std::string message);

    /// @brief Shorthand for `std::unexpected(MakeError(...))`.
    [[nodiscard]] inline std::unexpected<Error> Fail(ErrorCode code, std::string_view tag, std::string_view subject,
                                                     std::string message)
    {
        return std::unexpected(MakeError(code, tag, subject, std::move(message)));
    }

    /// @brief `code: message` rendering for logs and test output.
    [[nodiscard]] ARBOR_API std::string Describe(const Error& error);
}// namespace Arbor
