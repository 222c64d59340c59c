/// @file JsonParser.hpp
/// @brief Event-driven JSON reader used to load schema records.
#pragma once

#include <Arbor/Defines.hpp>
#include <Arbor/Primitives.hpp>
#include <Arbor/Serialization/Core/ParseError.hpp>

#include <expected>
#include <string_view>

namespace Arbor::Serialization
{
    struct JsonParseOptions
    {
        /// Accept `// line` and `/* block */` comments between tokens.
        bool     allowComments {false};
        bool     allowTrailingCommas {false};
        UIntSize maxDepth {256};
    };

    /// @brief Receives one call per JSON token, in document order.
    ///
    /// Returning false from any callback stops parsing with HandlerRejected.
    /// String views passed to callbacks are only valid during the call.
    /// Exceptions thrown by a callback propagate out of Parse.
    class ARBOR_API JsonReader
    {
    public:
        virtual ~JsonReader() = default;

        virtual bool OnNull()                         = 0;
        virtual bool OnBool(bool value)               = 0;
        virtual bool OnNumber(F64 value)              = 0;
        virtual bool OnString(std::string_view value) = 0;
        virtual bool OnStartObject()                  = 0;
        virtual bool OnKey(std::string_view key)      = 0;
        virtual bool OnEndObject()                    = 0;
        virtual bool OnStartArray()                   = 0;
        virtual bool OnEndArray()                     = 0;
    };

    class ARBOR_API JsonParser
    {
    public:
        /// @brief Feed one complete JSON document to `reader`.
        [[nodiscard]] static std::expected<void, ParseError>
        Parse(JsonReader& reader, std::string_view input, const JsonParseOptions& options = {});
    };
}// namespace Arbor::Serialization
