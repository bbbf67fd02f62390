#ifndef BLOCKSPLIT_SCHEMA_HPP
#define BLOCKSPLIT_SCHEMA_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace blocksplit
{

enum class FieldType
{
    NULL_TYPE,
    BOOLEAN,
    INT,
    LONG,
    FLOAT,
    DOUBLE,
    BYTES,
    STRING
};

/**
 * @brief      Convert a primitive type name to a FieldType
 *
 * @details    Throws ConfigurationError for unsupported names.
 */
FieldType field_type_from_string(std::string const& name);

std::string to_string(FieldType type);

struct Field {
    std::string name;
    FieldType type;
};

/**
 * @brief      A flat record schema
 *
 * @detail     Only records whose fields are primitive types are
 *             supported. Schemas are stored in the container header
 *             as JSON text and bound to sources either as parsed
 *             objects or as that JSON text.
 */
class Schema
{
  public:
    Schema();
    Schema(std::string name,
           std::vector<Field> fields,
           std::string name_space = "");

    /**
     * @brief      Parse a JSON record schema
     *
     * @param      json  JSON text of the form
     *                   {"type": "record", "name": ..., "fields": [...]}
     *
     * @return     The parsed schema. Throws ConfigurationError if the text
     *             is not valid JSON or describes an unsupported schema.
     */
    static Schema parse(std::string const& json);

    std::string const& name() const;
    std::string const& name_space() const;
    std::string full_name() const;
    std::vector<Field> const& fields() const;

    /**
     * @brief      Get the position of a named field
     *
     * @details    Throws std::out_of_range if the schema has no such field
     */
    std::size_t field_index(std::string const& field_name) const;

    /**
     * @brief      Serialise the schema to the JSON form stored in file headers
     */
    std::string to_json() const;

    bool operator==(Schema const& other) const;
    bool operator!=(Schema const& other) const;

  private:
    std::string _name;
    std::string _name_space;
    std::vector<Field> _fields;
};

} // namespace blocksplit

#endif // BLOCKSPLIT_SCHEMA_HPP
