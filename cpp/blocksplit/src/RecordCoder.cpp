#include "blocksplit/RecordCoder.hpp"
#include "blocksplit/Errors.hpp"

#include <boost/log/trivial.hpp>
#include <sstream>

namespace blocksplit
{

GenericRecordDecoder::GenericRecordDecoder(std::shared_ptr<Schema const> schema)
    : _schema(std::move(schema))
{
}

GenericRecord GenericRecordDecoder::decode(BinaryDecoder& decoder) const
{
    return GenericRecord::decode(_schema, decoder);
}

Schema const& GenericRecordDecoder::schema() const
{
    return *_schema;
}

namespace
{

struct SchemaResolver {
    ContainerHeader const& header;

    Schema operator()(std::monostate) const
    {
        std::string json = header.schema_json();
        if(json.empty()) {
            throw ConfigurationError(
                "No schema bound and the file header carries none");
        }
        return Schema::parse(json);
    }

    Schema operator()(Schema const& schema) const { return schema; }

    Schema operator()(std::string const& json) const
    {
        return Schema::parse(json);
    }
};

struct BindingDescriber {
    std::string operator()(std::monostate) const { return "file schema"; }

    std::string operator()(Schema const& schema) const
    {
        return "schema " + schema.full_name();
    }

    std::string operator()(std::string const& json) const
    {
        return "schema JSON (" + std::to_string(json.size()) + " chars)";
    }
};

} // namespace

template <>
std::unique_ptr<RecordDecoder<GenericRecord>>
make_record_decoder<GenericRecord>(SchemaBinding const& binding,
                                   ContainerHeader const& header)
{
    auto schema = std::make_shared<Schema const>(
        std::visit(SchemaResolver{header}, binding));
    BOOST_LOG_TRIVIAL(debug) << "Decoding generic records with schema "
                             << schema->full_name() << " ("
                             << to_string(binding) << ")";
    return std::make_unique<GenericRecordDecoder>(schema);
}

std::string to_string(SchemaBinding const& binding)
{
    return std::visit(BindingDescriber{}, binding);
}

} // namespace blocksplit
