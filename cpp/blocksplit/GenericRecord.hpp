#ifndef BLOCKSPLIT_GENERICRECORD_HPP
#define BLOCKSPLIT_GENERICRECORD_HPP

#include "blocksplit/BinaryEncoding.hpp"
#include "blocksplit/Schema.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace blocksplit
{

/**
 * Field value of a GenericRecord. The alternative in use follows the
 * FieldType of the field: monostate for null, then boolean, int, long,
 * float, double, bytes and string.
 */
using Value = std::variant<std::monostate,
                           bool,
                           std::int32_t,
                           std::int64_t,
                           float,
                           double,
                           Bytes,
                           std::string>;

/**
 * @brief      A record whose layout is described by a Schema at runtime
 */
class GenericRecord
{
  public:
    explicit GenericRecord(std::shared_ptr<Schema const> schema);

    Schema const& schema() const;

    /**
     * @brief      Get a field value by name
     *
     * @details    Throws std::out_of_range for unknown fields
     */
    Value const& get(std::string const& field_name) const;

    /**
     * @brief      Get a field value by name as a concrete type
     *
     * @details    Throws std::bad_variant_access if the field holds
     *             another type
     */
    template <typename T>
    T const& get_as(std::string const& field_name) const
    {
        return std::get<T>(get(field_name));
    }

    /**
     * @brief      Set a field value by name
     *
     * @details    Throws std::invalid_argument if the value does not
     *             match the field type
     */
    void set(std::string const& field_name, Value value);

    /**
     * @brief      Decode one record laid out according to schema
     */
    static GenericRecord decode(std::shared_ptr<Schema const> schema,
                                BinaryDecoder& decoder);

    /**
     * @brief      Append the binary encoding of this record
     */
    void encode(BinaryEncoder& encoder) const;

    std::string to_string() const;

    bool operator==(GenericRecord const& other) const;
    bool operator!=(GenericRecord const& other) const;

  private:
    std::shared_ptr<Schema const> _schema;
    std::vector<Value> _values;
};

} // namespace blocksplit

#endif // BLOCKSPLIT_GENERICRECORD_HPP
