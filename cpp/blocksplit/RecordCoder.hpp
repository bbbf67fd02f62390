#ifndef BLOCKSPLIT_RECORDCODER_HPP
#define BLOCKSPLIT_RECORDCODER_HPP

#include "blocksplit/BinaryEncoding.hpp"
#include "blocksplit/ContainerHeader.hpp"
#include "blocksplit/Errors.hpp"
#include "blocksplit/GenericRecord.hpp"
#include "blocksplit/Schema.hpp"

#include <memory>
#include <string>
#include <variant>

namespace blocksplit
{

/**
 * @brief      Customisation point mapping a user type to the container
 *             encoding
 *
 * @detail     Specialise for each record type read or written as a typed
 *             value. A specialisation provides
 *
 *             static Schema schema();
 *             static T decode(BinaryDecoder& decoder);
 *             static void encode(T const& value, BinaryEncoder& encoder);
 */
template <typename T>
struct RecordCoder;

/**
 * How the records of a Source are to be decoded: with the writer schema
 * stored in each file header (monostate), with a parsed Schema or with
 * the JSON text of a schema, parsed when a reader opens.
 */
using SchemaBinding = std::variant<std::monostate, Schema, std::string>;

/**
 * @brief      Turns the bytes of a decompressed block into records
 */
template <typename T>
class RecordDecoder
{
  public:
    virtual ~RecordDecoder() {}
    virtual T decode(BinaryDecoder& decoder) const = 0;
};

/**
 * @brief      Decodes typed records through RecordCoder<T>
 */
template <typename T>
class CoderRecordDecoder: public RecordDecoder<T>
{
  public:
    T decode(BinaryDecoder& decoder) const override
    {
        return RecordCoder<T>::decode(decoder);
    }
};

/**
 * @brief      Decodes GenericRecords laid out by a runtime schema
 */
class GenericRecordDecoder: public RecordDecoder<GenericRecord>
{
  public:
    explicit GenericRecordDecoder(std::shared_ptr<Schema const> schema);
    GenericRecord decode(BinaryDecoder& decoder) const override;
    Schema const& schema() const;

  private:
    std::shared_ptr<Schema const> _schema;
};

/**
 * @brief      Resolve a schema binding against an opened file
 *
 * @param      binding  The binding carried by the Source
 * @param      header   The header of the file being read
 *
 * @details    Typed records always decode with RecordCoder<T>, so the
 *             binding carries no extra information for them. A writer
 *             schema in the header must then equal RecordCoder<T>::schema().
 *             Throws ConfigurationError if a binding cannot be turned into
 *             a decoder.
 */
template <typename T>
std::unique_ptr<RecordDecoder<T>>
make_record_decoder(SchemaBinding const& /*binding*/,
                    ContainerHeader const& header)
{
    std::string json = header.schema_json();
    if(!json.empty()) {
        Schema writer_schema = Schema::parse(json);
        if(writer_schema != RecordCoder<T>::schema()) {
            throw ConfigurationError("File written with schema " +
                                     writer_schema.full_name() +
                                     " cannot be read as " +
                                     RecordCoder<T>::schema().full_name());
        }
    }
    return std::make_unique<CoderRecordDecoder<T>>();
}

template <>
std::unique_ptr<RecordDecoder<GenericRecord>>
make_record_decoder<GenericRecord>(SchemaBinding const& binding,
                                   ContainerHeader const& header);

/**
 * @brief      Describe a schema binding for logging
 */
std::string to_string(SchemaBinding const& binding);

} // namespace blocksplit

#endif // BLOCKSPLIT_RECORDCODER_HPP
