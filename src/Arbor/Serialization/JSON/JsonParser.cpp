#include <Arbor/Serialization/JSON/JsonParser.hpp>

#include <charconv>
#include <string>
#include <utility>

namespace Arbor::Serialization
{
    namespace
    {
        using Status = std::expected<void, ParseError>;

        [[nodiscard]] bool IsDigit(char c) noexcept
        {
            return c >= '0' && c <= '9';
        }

        /// -1 for anything that is not a hex digit.
        [[nodiscard]] int HexDigit(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        void AppendUtf8(std::string& out, UInt32 codepoint)
        {
            if (codepoint < 0x80)
            {
                out += static_cast<char>(codepoint);
                return;
            }
            if (codepoint < 0x800)
            {
                out += static_cast<char>(0xC0 | (codepoint >> 6));
            }
            else if (codepoint < 0x10000)
            {
                out += static_cast<char>(0xE0 | (codepoint >> 12));
                out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            }
            else
            {
                out += static_cast<char>(0xF0 | (codepoint >> 18));
                out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            }
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }

        class EventParser
        {
        public:
            EventParser(JsonReader& reader, std::string_view input, const JsonParseOptions& options) noexcept
                : m_reader(reader), m_options(options), m_input(input)
            {
            }

            Status Document()
            {
                if (auto value = Value(); !value)
                    return value;
                if (auto tail = SkipBlank(); !tail)
                    return tail;
                if (!AtEnd())
                    return Failure(ParseErrorCode::TrailingCharacters, "Trailing characters after JSON");
                return {};
            }

        private:
            [[nodiscard]] bool AtEnd() const noexcept { return m_pos >= m_input.size(); }

            [[nodiscard]] char Peek(UIntSize ahead = 0) const noexcept
            {
                return m_pos + ahead < m_input.size() ? m_input[m_pos + ahead] : '\0';
            }

            /// Moves forward `count` bytes, keeping track of line starts.
            void Skip(UIntSize count = 1) noexcept
            {
                for (; count > 0 && m_pos < m_input.size(); --count)
                {
                    if (m_input[m_pos++] == '\n')
                    {
                        ++m_line;
                        m_lineStart = m_pos;
                    }
                }
            }

            [[nodiscard]] std::unexpected<ParseError> Failure(ParseErrorCode code, const char* message) const
            {
                ParseError error;
                error.code     = code;
                error.location = {m_pos, m_line, m_pos - m_lineStart + 1};
                error.message  = message;
                return std::unexpected(std::move(error));
            }

            [[nodiscard]] std::unexpected<ParseError> Rejected(const char* what) const
            {
                return Failure(ParseErrorCode::HandlerRejected, what);
            }

            Status SkipBlank()
            {
                while (!AtEnd())
                {
                    const char c = Peek();
                    if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
                    {
                        Skip();
                        continue;
                    }
                    if (c != '/' || !m_options.allowComments)
                        return {};

                    if (Peek(1) == '/')
                    {
                        while (!AtEnd() && Peek() != '\n' && Peek() != '\r')
                            Skip();
                    }
                    else if (Peek(1) == '*')
                    {
                        const UIntSize close = m_input.find("*/", m_pos + 2);
                        if (close == std::string_view::npos)
                        {
                            Skip(m_input.size() - m_pos);
                            return Failure(ParseErrorCode::UnexpectedEnd, "Unterminated comment");
                        }
                        Skip(close + 2 - m_pos);
                    }
                    else
                    {
                        return Failure(ParseErrorCode::InvalidToken, "Invalid comment token");
                    }
                }
                return {};
            }

            [[nodiscard]] bool StartsWith(std::string_view word) const noexcept
            {
                return m_input.substr(m_pos, word.size()) == word;
            }

            Status Value()
            {
                if (auto blank = SkipBlank(); !blank)
                    return blank;
                if (AtEnd())
                    return Failure(ParseErrorCode::UnexpectedEnd, "Unexpected end of input");

                switch (const char c = Peek())
                {
                    case '{':
                        return Object();
                    case '[':
                        return Array();
                    case '"': {
                        auto text = String();
                        if (!text)
                            return std::unexpected(std::move(text.error()));
                        return m_reader.OnString(*text) ? Status {} : Rejected("Handler rejected string");
                    }
                    case 'n':
                        if (!StartsWith("null"))
                            return Failure(ParseErrorCode::InvalidToken, "Invalid literal");
                        Skip(4);
                        return m_reader.OnNull() ? Status {} : Rejected("Handler rejected null");
                    case 't':
                    case 'f': {
                        const bool             value = c == 't';
                        const std::string_view word  = value ? "true" : "false";
                        if (!StartsWith(word))
                            return Failure(ParseErrorCode::InvalidToken, "Invalid literal");
                        Skip(word.size());
                        return m_reader.OnBool(value) ? Status {} : Rejected("Handler rejected bool");
                    }
                    default:
                        if (c != '-' && !IsDigit(c))
                            return Failure(ParseErrorCode::UnexpectedCharacter, "Unexpected token");
                        auto number = Number();
                        if (!number)
                            return std::unexpected(std::move(number.error()));
                        return m_reader.OnNumber(*number) ? Status {} : Rejected("Handler rejected number");
                }
            }

            /// Parses the members of an object or array after its opening bracket.
            /// `member` parses one entry; `close` is the closing bracket.
            template<typename Member>
            Status Members(char close, Member&& member)
            {
                if (auto blank = SkipBlank(); !blank)
                    return blank;
                if (Peek() == close)
                {
                    Skip();
                    return {};
                }
                while (true)
                {
                    if (auto entry = member(); !entry)
                        return entry;
                    if (auto blank = SkipBlank(); !blank)
                        return blank;

                    if (Peek() == close)
                    {
                        Skip();
                        return {};
                    }
                    if (Peek() != ',')
                    {
                        if (AtEnd())
                            return Failure(ParseErrorCode::UnexpectedEnd, "Unterminated container");
                        return Failure(ParseErrorCode::UnexpectedCharacter,
                                       close == ']' ? "Expected ',' or ']'" : "Expected ',' or '}'");
                    }
                    Skip();
                    if (auto blank = SkipBlank(); !blank)
                        return blank;
                    if (Peek() == close)
                    {
                        if (!m_options.allowTrailingCommas)
                            return Failure(ParseErrorCode::InvalidToken, "Trailing comma");
                        Skip();
                        return {};
                    }
                }
            }

            Status Enter()
            {
                if (m_depth >= m_options.maxDepth)
                    return Failure(ParseErrorCode::DepthExceeded, "Nesting too deep");
                ++m_depth;
                Skip();
                return {};
            }

            Status Array()
            {
                if (auto entered = Enter(); !entered)
                    return entered;
                if (!m_reader.OnStartArray())
                    return Rejected("Handler rejected array");

                auto members = Members(']', [this] { return Value(); });
                if (!members)
                    return members;

                --m_depth;
                return m_reader.OnEndArray() ? Status {} : Rejected("Handler rejected array");
            }

            Status Object()
            {
                if (auto entered = Enter(); !entered)
                    return entered;
                if (!m_reader.OnStartObject())
                    return Rejected("Handler rejected object");

                auto members = Members('}', [this]() -> Status {
                    auto key = String();
                    if (!key)
                        return std::unexpected(std::move(key.error()));
                    if (!m_reader.OnKey(*key))
                        return Rejected("Handler rejected key");
                    if (auto blank = SkipBlank(); !blank)
                        return blank;
                    if (Peek() != ':')
                        return Failure(ParseErrorCode::UnexpectedCharacter, "Expected ':'");
                    Skip();
                    return Value();
                });
                if (!members)
                    return members;

                --m_depth;
                return m_reader.OnEndObject() ? Status {} : Rejected("Handler rejected object");
            }

            /// Reads four hex digits at `at`.
            [[nodiscard]] bool Hex4(UIntSize at, UInt32& out) const noexcept
            {
                if (at + 4 > m_input.size())
                    return false;
                out = 0;
                for (UIntSize i = 0; i < 4; ++i)
                {
                    const int digit = HexDigit(m_input[at + i]);
                    if (digit < 0)
                        return false;
                    out = (out << 4) | static_cast<UInt32>(digit);
                }
                return true;
            }

            /// Returns a view into the input when there are no escapes, otherwise into m_scratch.
            std::expected<std::string_view, ParseError> String()
            {
                if (Peek() != '"')
                    return Failure(ParseErrorCode::InvalidToken, "Expected string");
                Skip();

                const UIntSize begin   = m_pos;
                bool           escaped = false;
                m_scratch.clear();
                while (true)
                {
                    if (AtEnd())
                        return Failure(ParseErrorCode::UnexpectedEnd, "Unterminated string");
                    const char c = Peek();
                    if (c == '"')
                        break;
                    if (static_cast<unsigned char>(c) < 0x20)
                        return Failure(ParseErrorCode::InvalidToken, "Control character in string");
                    if (c != '\\')
                    {
                        if (escaped)
                            m_scratch += c;
                        Skip();
                        continue;
                    }

                    if (!escaped)
                    {
                        m_scratch.assign(m_input.substr(begin, m_pos - begin));
                        escaped = true;
                    }
                    if (auto decoded = Escape(); !decoded)
                        return std::unexpected(std::move(decoded.error()));
                }

                const std::string_view raw = m_input.substr(begin, m_pos - begin);
                Skip();
                if (escaped)
                    return std::string_view(m_scratch);
                return raw;
            }

            /// Decodes the escape sequence at the cursor into m_scratch.
            Status Escape()
            {
                if (m_pos + 1 >= m_input.size())
                    return Failure(ParseErrorCode::UnexpectedEnd, "Unterminated escape");

                const char kind = Peek(1);
                char       plain;
                switch (kind)
                {
                    case '"':
                    case '\\':
                    case '/':
                        plain = kind;
                        break;
                    case 'b':
                        plain = '\b';
                        break;
                    case 'f':
                        plain = '\f';
                        break;
                    case 'n':
                        plain = '\n';
                        break;
                    case 'r':
                        plain = '\r';
                        break;
                    case 't':
                        plain = '\t';
                        break;
                    case 'u':
                        return UnicodeEscape();
                    default:
                        return Failure(ParseErrorCode::InvalidStringEscape, "Invalid escape");
                }
                m_scratch += plain;
                Skip(2);
                return {};
            }

            Status UnicodeEscape()
            {
                UInt32 codepoint = 0;
                if (!Hex4(m_pos + 2, codepoint))
                    return Failure(ParseErrorCode::InvalidUnicodeEscape, "Invalid unicode escape");
                UIntSize length = 6;

                if (codepoint >= 0xD800 && codepoint <= 0xDBFF)
                {
                    UInt32 low = 0;
                    if (Peek(6) != '\\' || Peek(7) != 'u')
                        return Failure(ParseErrorCode::InvalidUnicodeEscape, "Missing low surrogate");
                    if (!Hex4(m_pos + 8, low) || low < 0xDC00 || low > 0xDFFF)
                        return Failure(ParseErrorCode::InvalidUnicodeEscape, "Invalid surrogate pair");
                    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                    length    = 12;
                }
                AppendUtf8(m_scratch, codepoint);
                Skip(length);
                return {};
            }

            /// Strict JSON number grammar, converted with from_chars.
            std::expected<F64, ParseError> Number()
            {
                UIntSize end = m_pos;
                const auto digits = [&] {
                    const UIntSize first = end;
                    while (end < m_input.size() && IsDigit(m_input[end]))
                        ++end;
                    return end > first;
                };

                if (m_input[end] == '-')
                    ++end;
                if (end < m_input.size() && m_input[end] == '0')
                    ++end;
                else if (!digits())
                    return Failure(end >= m_input.size() ? ParseErrorCode::UnexpectedEnd : ParseErrorCode::InvalidNumber,
                                   "Invalid number");

                if (end < m_input.size() && m_input[end] == '.')
                {
                    ++end;
                    if (!digits())
                        return Failure(ParseErrorCode::InvalidNumber, "Invalid fraction");
                }
                if (end < m_input.size() && (m_input[end] == 'e' || m_input[end] == 'E'))
                {
                    ++end;
                    if (end < m_input.size() && (m_input[end] == '+' || m_input[end] == '-'))
                        ++end;
                    if (!digits())
                        return Failure(ParseErrorCode::InvalidNumber, "Invalid exponent");
                }

                F64         value = 0.0;
                const char* first = m_input.data() + m_pos;
                const char* last  = m_input.data() + end;
                const auto  [ptr, ec] = std::from_chars(first, last, value);
                if (ec != std::errc {} || ptr != last)
                    return Failure(ParseErrorCode::InvalidNumber, "Number out of range");
                Skip(end - m_pos);
                return value;
            }

            JsonReader&             m_reader;
            const JsonParseOptions& m_options;
            std::string_view        m_input;
            UIntSize                m_pos {0};
            UIntSize                m_line {1};
            UIntSize                m_lineStart {0};
            UIntSize                m_depth {0};
            std::string             m_scratch {};
        };
    }// namespace

    std::expected<void, ParseError> JsonParser::Parse(JsonReader& reader, std::string_view input,
                                                      const JsonParseOptions& options)
    {
        EventParser parser(reader, input, options);
        return parser.Document();
    }
}// namespace Arbor::Serialization
