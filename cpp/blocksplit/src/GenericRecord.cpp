#include "blocksplit/GenericRecord.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace blocksplit
{
namespace
{

Value default_value(FieldType type)
{
    switch(type) {
    case FieldType::NULL_TYPE:
        return std::monostate{};
    case FieldType::BOOLEAN:
        return false;
    case FieldType::INT:
        return std::int32_t(0);
    case FieldType::LONG:
        return std::int64_t(0);
    case FieldType::FLOAT:
        return 0.0f;
    case FieldType::DOUBLE:
        return 0.0;
    case FieldType::BYTES:
        return Bytes{};
    case FieldType::STRING:
        return std::string{};
    }
    throw std::logic_error("Unknown FieldType");
}

// The Value alternatives are declared in FieldType order
inline bool matches(Value const& value, FieldType type)
{
    return value.index() == static_cast<std::size_t>(type);
}

} // namespace

GenericRecord::GenericRecord(std::shared_ptr<Schema const> schema)
    : _schema(std::move(schema))
{
    if(!_schema) {
        throw std::invalid_argument("GenericRecord requires a schema");
    }
    _values.reserve(_schema->fields().size());
    for(auto const& field: _schema->fields()) {
        _values.push_back(default_value(field.type));
    }
}

Schema const& GenericRecord::schema() const
{
    return *_schema;
}

Value const& GenericRecord::get(std::string const& field_name) const
{
    return _values[_schema->field_index(field_name)];
}

void GenericRecord::set(std::string const& field_name, Value value)
{
    std::size_t idx = _schema->field_index(field_name);
    FieldType type  = _schema->fields()[idx].type;
    if(!matches(value, type)) {
        throw std::invalid_argument("Value for field '" + field_name +
                                    "' does not match its type " +
                                    blocksplit::to_string(type));
    }
    _values[idx] = std::move(value);
}

GenericRecord GenericRecord::decode(std::shared_ptr<Schema const> schema,
                                    BinaryDecoder& decoder)
{
    GenericRecord record(std::move(schema));
    auto const& fields = record._schema->fields();
    for(std::size_t ii = 0; ii < fields.size(); ++ii) {
        switch(fields[ii].type) {
        case FieldType::NULL_TYPE:
            break;
        case FieldType::BOOLEAN:
            record._values[ii] = decoder.read_boolean();
            break;
        case FieldType::INT:
            record._values[ii] = decoder.read_int();
            break;
        case FieldType::LONG:
            record._values[ii] = decoder.read_long();
            break;
        case FieldType::FLOAT:
            record._values[ii] = decoder.read_float();
            break;
        case FieldType::DOUBLE:
            record._values[ii] = decoder.read_double();
            break;
        case FieldType::BYTES:
            record._values[ii] = decoder.read_bytes();
            break;
        case FieldType::STRING:
            record._values[ii] = decoder.read_string();
            break;
        }
    }
    return record;
}

void GenericRecord::encode(BinaryEncoder& encoder) const
{
    auto const& fields = _schema->fields();
    for(std::size_t ii = 0; ii < fields.size(); ++ii) {
        Value const& value = _values[ii];
        switch(fields[ii].type) {
        case FieldType::NULL_TYPE:
            break;
        case FieldType::BOOLEAN:
            encoder.write_boolean(std::get<bool>(value));
            break;
        case FieldType::INT:
            encoder.write_int(std::get<std::int32_t>(value));
            break;
        case FieldType::LONG:
            encoder.write_long(std::get<std::int64_t>(value));
            break;
        case FieldType::FLOAT:
            encoder.write_float(std::get<float>(value));
            break;
        case FieldType::DOUBLE:
            encoder.write_double(std::get<double>(value));
            break;
        case FieldType::BYTES:
            encoder.write_bytes(std::get<Bytes>(value));
            break;
        case FieldType::STRING:
            encoder.write_string(std::get<std::string>(value));
            break;
        }
    }
}

std::string GenericRecord::to_string() const
{
    std::ostringstream oss;
    oss << "{";
    auto const& fields = _schema->fields();
    for(std::size_t ii = 0; ii < fields.size(); ++ii) {
        if(ii > 0) {
            oss << ", ";
        }
        oss << "\"" << fields[ii].name << "\": ";
        Value const& value = _values[ii];
        switch(fields[ii].type) {
        case FieldType::NULL_TYPE:
            oss << "null";
            break;
        case FieldType::BOOLEAN:
            oss << std::boolalpha << std::get<bool>(value);
            break;
        case FieldType::INT:
            oss << std::get<std::int32_t>(value);
            break;
        case FieldType::LONG:
            oss << std::get<std::int64_t>(value);
            break;
        case FieldType::FLOAT:
            oss << std::get<float>(value);
            break;
        case FieldType::DOUBLE:
            oss << std::get<double>(value);
            break;
        case FieldType::BYTES:
            oss << "\"";
            for(auto byte: std::get<Bytes>(value)) {
                oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(byte) << std::dec;
            }
            oss << "\"";
            break;
        case FieldType::STRING:
            oss << "\"" << std::get<std::string>(value) << "\"";
            break;
        }
    }
    oss << "}";
    return oss.str();
}

bool GenericRecord::operator==(GenericRecord const& other) const
{
    return *_schema == *other._schema && _values == other._values;
}

bool GenericRecord::operator!=(GenericRecord const& other) const
{
    return !(*this == other);
}

} // namespace blocksplit
