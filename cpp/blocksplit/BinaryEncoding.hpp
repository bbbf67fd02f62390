#ifndef BLOCKSPLIT_BINARYENCODING_HPP
#define BLOCKSPLIT_BINARYENCODING_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace blocksplit
{

using Bytes = std::vector<std::uint8_t>;

/**
 * @brief      Decodes container primitives from an in-memory buffer
 *
 * @details    Integers are zig-zag varints, floating point values are
 *             little-endian IEEE-754 and byte strings are length
 *             prefixed. The decoder does not own the buffer.
 */
class BinaryDecoder
{
  public:
    BinaryDecoder(char const* data, std::size_t size);

    std::int64_t read_long();
    std::int32_t read_int();
    bool read_boolean();
    float read_float();
    double read_double();
    Bytes read_bytes();
    std::string read_string();

    /**
     * @brief      Skip over nbytes of the buffer
     */
    void skip(std::size_t nbytes);

    std::size_t position() const;
    std::size_t remaining() const;

  private:
    void require(std::size_t nbytes) const;
    std::size_t read_length();

    char const* _data;
    std::size_t _size;
    std::size_t _position;
};

/**
 * @brief      Encodes container primitives into a growable buffer
 */
class BinaryEncoder
{
  public:
    BinaryEncoder();

    void write_long(std::int64_t value);
    void write_int(std::int32_t value);
    void write_boolean(bool value);
    void write_float(float value);
    void write_double(double value);
    void write_bytes(Bytes const& value);
    void write_string(std::string const& value);
    void write_fixed(char const* data, std::size_t size);

    std::vector<char> const& buffer() const;
    std::size_t size() const;
    void clear();

  private:
    std::vector<char> _buffer;
};

/**
 * @brief      Read a zig-zag varint long directly from a stream
 *
 * @details    Throws FormatError if the stream ends mid value or the
 *             encoding is longer than ten bytes.
 */
std::int64_t read_long(std::istream& stream);

/**
 * @brief      Read a length prefixed byte string directly from a stream
 */
std::string read_string(std::istream& stream);

/**
 * @brief      Write a zig-zag varint long to a stream
 */
void write_long(std::ostream& stream, std::int64_t value);

/**
 * @brief      Write a length prefixed byte string to a stream
 */
void write_string(std::ostream& stream, std::string const& value);

} // namespace blocksplit

#endif // BLOCKSPLIT_BINARYENCODING_HPP
