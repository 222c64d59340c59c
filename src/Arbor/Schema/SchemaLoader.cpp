#include <Arbor/Schema/SchemaLoader.hpp>

#include <Arbor/Diagnostics/Log.hpp>
#include <Arbor/IO/TextFile.hpp>
#include <Arbor/Serialization/JSON/JsonParser.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <new>
#include <system_error>

namespace Arbor::Schema
{
    namespace
    {
        using Serialization::JsonReader;

        /// Builds TagRecords from JSON events. Unknown keys are skipped, whatever their value.
        class TagRecordReader final : public JsonReader
        {
        public:
            bool OnNull() override { return OnScalar("null"); }

            bool OnBool(bool value) override
            {
                if (m_skipDepth > 0)
                    return true;
                switch (Top())
                {
                    case Frame::Record:
                        if (m_key == "has_global_attributes")
                            m_record.hasGlobalAttributes = value;
                        else if (m_key == "has_closing_tag")
                            m_record.hasClosingTag = value;
                        return true;
                    case Frame::Attribute:
                        return true;
                    default:
                        return Reject("unexpected boolean");
                }
            }

            bool OnNumber(F64) override { return OnScalar("number"); }

            bool OnString(std::string_view value) override
            {
                if (m_skipDepth > 0)
                    return true;
                switch (Top())
                {
                    case Frame::Record:
                        if (m_key == "tag_name")
                            m_record.tagName = value;
                        else if (m_key == "struct_name")
                            m_record.structName = value;
                        return true;
                    case Frame::Attribute:
                        if (m_key == "name")
                            m_attribute.name = value;
                        else if (m_key == "description")
                            m_attribute.description = value;
                        else if (m_key == "ty")
                            return SetSimpleKind(value);
                        return true;
                    case Frame::AttributeType:
                        if (m_key != "Identifier")
                            return Reject(std::format("unknown attribute type '{}'", m_key));
                        m_attribute.kind       = AttributeKind::Identifier;
                        m_attribute.identifier = value;
                        return true;
                    case Frame::EnumValues:
                        m_attribute.enumValues.emplace_back(value);
                        return true;
                    case Frame::CategoryList: {
                        auto category = ParseContentCategory(value);
                        if (!category)
                            return Reject(std::format("unknown content category '{}'", value));
                        m_categoryTarget->push_back(*category);
                        return true;
                    }
                    case Frame::NameList:
                        m_record.permittedChildren.emplace_back(value);
                        return true;
                    default:
                        return Reject("unexpected string");
                }
            }

            bool OnStartObject() override
            {
                if (m_skipDepth > 0)
                {
                    ++m_skipDepth;
                    return true;
                }
                switch (Top())
                {
                    case Frame::Root:
                    case Frame::RecordList:
                        m_record = TagRecord {};
                        m_frames.push_back(Frame::Record);
                        return true;
                    case Frame::AttributeList:
                        m_attribute = AttributeRecord {};
                        m_frames.push_back(Frame::Attribute);
                        return true;
                    case Frame::Attribute:
                        if (m_key == "ty")
                        {
                            m_frames.push_back(Frame::AttributeType);
                            return true;
                        }
                        m_skipDepth = 1;
                        return true;
                    case Frame::Record:
                        m_skipDepth = 1;
                        return true;
                    default:
                        return Reject("unexpected object");
                }
            }

            bool OnKey(std::string_view key) override
            {
                if (m_skipDepth == 0)
                    m_key = key;
                return true;
            }

            bool OnEndObject() override
            {
                if (m_skipDepth > 0)
                {
                    --m_skipDepth;
                    return true;
                }
                const Frame frame = Top();
                m_frames.pop_back();
                if (frame == Frame::Record)
                {
                    if (m_record.tagName.empty())
                        return Reject("record without tag_name");
                    m_records.push_back(std::move(m_record));
                    m_record = TagRecord {};
                }
                else if (frame == Frame::Attribute)
                {
                    if (m_attribute.name.empty())
                        return Reject("attribute without name");
                    m_record.attributes.push_back(std::move(m_attribute));
                    m_attribute = AttributeRecord {};
                    m_key.clear();
                }
                else if (frame == Frame::AttributeType)
                {
                    m_key.clear();
                }
                return true;
            }

            bool OnStartArray() override
            {
                if (m_skipDepth > 0)
                {
                    ++m_skipDepth;
                    return true;
                }
                switch (Top())
                {
                    case Frame::Root:
                        m_frames.push_back(Frame::RecordList);
                        return true;
                    case Frame::Record:
                        if (m_key == "attributes")
                            m_frames.push_back(Frame::AttributeList);
                        else if (m_key == "content_categories")
                            PushCategoryList(m_record.categories);
                        else if (m_key == "permitted_content")
                            PushCategoryList(m_record.permittedContent);
                        else if (m_key == "permitted_child_elements")
                            m_frames.push_back(Frame::NameList);
                        else
                            m_skipDepth = 1;
                        return true;
                    case Frame::Attribute:
                        m_skipDepth = 1;
                        return true;
                    case Frame::AttributeType:
                        if (m_key != "Enumerable")
                            return Reject(std::format("unknown attribute type '{}'", m_key));
                        m_attribute.kind = AttributeKind::Enumerable;
                        m_frames.push_back(Frame::EnumValues);
                        return true;
                    default:
                        return Reject("unexpected array");
                }
            }

            bool OnEndArray() override
            {
                if (m_skipDepth > 0)
                {
                    --m_skipDepth;
                    return true;
                }
                m_frames.pop_back();
                return true;
            }

            [[nodiscard]] std::vector<TagRecord>& Records() noexcept { return m_records; }
            [[nodiscard]] const std::string& Problem() const noexcept { return m_problem; }

        private:
            enum class Frame
            {
                Root,
                RecordList,
                Record,
                AttributeList,
                Attribute,
                AttributeType,
                EnumValues,
                CategoryList,
                NameList,
            };

            [[nodiscard]] Frame Top() const noexcept
            {
                return m_frames.empty() ? Frame::Root : m_frames.back();
            }

            bool OnScalar(const char* what)
            {
                if (m_skipDepth > 0)
                    return true;
                const Frame frame = Top();
                if (frame == Frame::Record || frame == Frame::Attribute)
                    return true;
                return Reject(std::format("unexpected {}", what));
            }

            void PushCategoryList(std::vector<ContentCategory>& target)
            {
                m_categoryTarget = &target;
                m_frames.push_back(Frame::CategoryList);
            }

            bool SetSimpleKind(std::string_view value)
            {
                if (value == "Bool")
                    m_attribute.kind = AttributeKind::Bool;
                else if (value == "KString" || value == "Text")
                    m_attribute.kind = AttributeKind::Text;
                else if (value == "Integer")
                    m_attribute.kind = AttributeKind::Integer;
                else if (value == "Float")
                    m_attribute.kind = AttributeKind::Float;
                else
                    return Reject(std::format("unknown attribute type '{}'", value));
                return true;
            }

            bool Reject(std::string problem)
            {
                if (!m_record.tagName.empty())
                    m_problem = std::format("{} (in record '{}')", problem, m_record.tagName);
                else
                    m_problem = std::move(problem);
                return false;
            }

            std::vector<Frame>            m_frames;
            std::vector<TagRecord>        m_records;
            TagRecord                     m_record;
            AttributeRecord               m_attribute;
            std::vector<ContentCategory>* m_categoryTarget {nullptr};
            std::string                   m_key;
            std::string                   m_problem;
            UIntSize                      m_skipDepth {0};
        };

        [[nodiscard]] std::unexpected<Error> SchemaIOError(const std::string& path, const std::string& message)
        {
            return Fail(ErrorCode::SchemaIO, "", path, message);
        }

        Expected<void> AppendRecordsFromFile(const std::string& path, const SchemaLoadOptions& options,
                                             std::vector<TagRecord>& out)
        {
            auto text = IO::ReadTextFile(path);
            if (!text)
                return SchemaIOError(path, text.error().message);
            auto records = ParseTagRecords(*text, options);
            if (!records)
            {
                Error err = std::move(records.error());
                err.subject = path;
                err.message = std::format("{}: {}", path, err.message);
                return std::unexpected(std::move(err));
            }
            out.insert(out.end(), std::make_move_iterator(records->begin()), std::make_move_iterator(records->end()));
            return {};
        }
    }// namespace

    Expected<std::vector<TagRecord>> ParseTagRecords(std::string_view json, const SchemaLoadOptions& options)
    {
        TagRecordReader reader;

        Serialization::JsonParseOptions parseOptions;
        parseOptions.allowComments = options.allowComments;
        parseOptions.maxDepth      = options.maxDepth;

        std::expected<void, Serialization::ParseError> parsed;
        try
        {
            parsed = Serialization::JsonParser::Parse(reader, json, parseOptions);
        }
        catch (const std::bad_alloc&)
        {
            return Fail(ErrorCode::SchemaParse, "", "", "out of memory while reading tag records");
        }
        if (!parsed)
        {
            Serialization::ParseError err = std::move(parsed.error());
            if (err.code == Serialization::ParseErrorCode::HandlerRejected && !reader.Problem().empty())
                err.message = reader.Problem();
            return Fail(ErrorCode::SchemaParse, "", "", Serialization::Describe(err));
        }
        return std::move(reader.Records());
    }

    Expected<std::vector<TagRecord>> ReadTagRecords(const std::string& path, const SchemaLoadOptions& options)
    {
        std::error_code ec;
        const std::filesystem::path root(path);
        std::vector<TagRecord>      records;

        if (!std::filesystem::is_directory(root, ec))
        {
            auto result = AppendRecordsFromFile(path, options, records);
            if (!result)
                return std::unexpected(std::move(result.error()));
            return records;
        }

        std::vector<std::filesystem::path> files;
        for (std::filesystem::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec))
        {
            if (it->path().extension() == ".json" && it->is_regular_file(ec))
                files.push_back(it->path());
        }
        if (ec)
            return SchemaIOError(path, std::format("cannot list '{}': {}", path, ec.message()));
        std::sort(files.begin(), files.end());

        for (const auto& file: files)
        {
            auto result = AppendRecordsFromFile(file.string(), options, records);
            if (!result)
                return std::unexpected(std::move(result.error()));
        }
        Diagnostics::Log(Diagnostics::LogLevel::Debug, "SchemaLoader", "read {} records from {} files in {}",
                         records.size(), files.size(), path);
        return records;
    }

    Expected<SchemaDatabase> LoadSchema(const std::string& path, const SchemaLoadOptions& options)
    {
        auto records = ReadTagRecords(path, options);
        if (!records)
            return std::unexpected(std::move(records.error()));
        auto db = SchemaDatabase::FromRecords(*records);
        if (db)
            Diagnostics::Log(Diagnostics::LogLevel::Info, "SchemaLoader", "loaded {} tags from {}", db->Size(), path);
        return db;
    }
}// namespace Arbor::Schema
