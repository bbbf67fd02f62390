#include "blocksplit/BinaryEncoding.hpp"
#include "blocksplit/Errors.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

namespace blocksplit
{
namespace
{

// A 64-bit zig-zag varint never needs more than ten bytes
constexpr int MAX_VARINT_BYTES = 10;

inline std::int64_t zigzag_decode(std::uint64_t n)
{
    return static_cast<std::int64_t>(n >> 1) ^ -static_cast<std::int64_t>(n & 1);
}

inline std::uint64_t zigzag_encode(std::int64_t n)
{
    return (static_cast<std::uint64_t>(n) << 1) ^
           static_cast<std::uint64_t>(n >> 63);
}

template <typename Appender>
void encode_varint(std::uint64_t value, Appender&& append)
{
    while(value & ~0x7FULL) {
        append(static_cast<char>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    append(static_cast<char>(value));
}

} // namespace

BinaryDecoder::BinaryDecoder(char const* data, std::size_t size)
    : _data(data), _size(size), _position(0)
{
}

void BinaryDecoder::require(std::size_t nbytes) const
{
    if(nbytes > _size - _position) {
        std::stringstream error_message;
        error_message << "Unexpected end of buffer: needed " << nbytes
                      << " bytes at position " << _position << " of "
                      << _size;
        throw FormatError(error_message.str());
    }
}

std::int64_t BinaryDecoder::read_long()
{
    std::uint64_t value = 0;
    int shift           = 0;
    for(int i = 0; i < MAX_VARINT_BYTES; ++i) {
        require(1);
        auto byte = static_cast<std::uint8_t>(_data[_position++]);
        value |= static_cast<std::uint64_t>(byte & 0x7F) << shift;
        if((byte & 0x80) == 0) {
            return zigzag_decode(value);
        }
        shift += 7;
    }
    throw FormatError("Invalid varint: more than 10 bytes");
}

std::int32_t BinaryDecoder::read_int()
{
    std::int64_t value = read_long();
    if(value < INT32_MIN || value > INT32_MAX) {
        throw FormatError("Varint does not fit in a 32-bit int");
    }
    return static_cast<std::int32_t>(value);
}

bool BinaryDecoder::read_boolean()
{
    require(1);
    return _data[_position++] != 0;
}

float BinaryDecoder::read_float()
{
    require(4);
    std::uint32_t bits = 0;
    for(int i = 0; i < 4; ++i) {
        bits |= static_cast<std::uint32_t>(
                    static_cast<std::uint8_t>(_data[_position + i]))
                << (8 * i);
    }
    _position += 4;
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

double BinaryDecoder::read_double()
{
    require(8);
    std::uint64_t bits = 0;
    for(int i = 0; i < 8; ++i) {
        bits |= static_cast<std::uint64_t>(
                    static_cast<std::uint8_t>(_data[_position + i]))
                << (8 * i);
    }
    _position += 8;
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::size_t BinaryDecoder::read_length()
{
    std::int64_t length = read_long();
    if(length < 0) {
        throw FormatError("Negative length prefix: " + std::to_string(length));
    }
    require(static_cast<std::size_t>(length));
    return static_cast<std::size_t>(length);
}

Bytes BinaryDecoder::read_bytes()
{
    std::size_t length = read_length();
    auto begin = reinterpret_cast<std::uint8_t const*>(_data + _position);
    Bytes value(begin, begin + length);
    _position += length;
    return value;
}

std::string BinaryDecoder::read_string()
{
    std::size_t length = read_length();
    std::string value(_data + _position, length);
    _position += length;
    return value;
}

void BinaryDecoder::skip(std::size_t nbytes)
{
    require(nbytes);
    _position += nbytes;
}

std::size_t BinaryDecoder::position() const
{
    return _position;
}

std::size_t BinaryDecoder::remaining() const
{
    return _size - _position;
}

BinaryEncoder::BinaryEncoder()
{
}

void BinaryEncoder::write_long(std::int64_t value)
{
    encode_varint(zigzag_encode(value),
                  [this](char c) { _buffer.push_back(c); });
}

void BinaryEncoder::write_int(std::int32_t value)
{
    write_long(value);
}

void BinaryEncoder::write_boolean(bool value)
{
    _buffer.push_back(value ? 1 : 0);
}

void BinaryEncoder::write_float(float value)
{
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for(int i = 0; i < 4; ++i) {
        _buffer.push_back(static_cast<char>((bits >> (8 * i)) & 0xFF));
    }
}

void BinaryEncoder::write_double(double value)
{
    std::uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for(int i = 0; i < 8; ++i) {
        _buffer.push_back(static_cast<char>((bits >> (8 * i)) & 0xFF));
    }
}

void BinaryEncoder::write_bytes(Bytes const& value)
{
    write_long(static_cast<std::int64_t>(value.size()));
    _buffer.insert(_buffer.end(), value.begin(), value.end());
}

void BinaryEncoder::write_string(std::string const& value)
{
    write_long(static_cast<std::int64_t>(value.size()));
    _buffer.insert(_buffer.end(), value.begin(), value.end());
}

void BinaryEncoder::write_fixed(char const* data, std::size_t size)
{
    _buffer.insert(_buffer.end(), data, data + size);
}

std::vector<char> const& BinaryEncoder::buffer() const
{
    return _buffer;
}

std::size_t BinaryEncoder::size() const
{
    return _buffer.size();
}

void BinaryEncoder::clear()
{
    _buffer.clear();
}

std::int64_t read_long(std::istream& stream)
{
    std::uint64_t value = 0;
    int shift           = 0;
    for(int i = 0; i < MAX_VARINT_BYTES; ++i) {
        int c = stream.get();
        if(c == std::char_traits<char>::eof()) {
            throw FormatError("Unexpected end of stream while reading varint");
        }
        auto byte = static_cast<std::uint8_t>(c);
        value |= static_cast<std::uint64_t>(byte & 0x7F) << shift;
        if((byte & 0x80) == 0) {
            return zigzag_decode(value);
        }
        shift += 7;
    }
    throw FormatError("Invalid varint: more than 10 bytes");
}

std::string read_string(std::istream& stream)
{
    std::int64_t length = read_long(stream);
    if(length < 0) {
        throw FormatError("Negative length prefix: " + std::to_string(length));
    }
    // Read in bounded chunks so a corrupt length fails on EOF rather
    // than on allocation
    constexpr std::size_t chunk = 64 * 1024;
    std::string value;
    std::size_t remaining = static_cast<std::size_t>(length);
    char buffer[chunk];
    while(remaining > 0) {
        std::size_t nread = std::min(remaining, chunk);
        stream.read(buffer, static_cast<std::streamsize>(nread));
        if(static_cast<std::size_t>(stream.gcount()) != nread) {
            throw FormatError("Unexpected end of stream while reading " +
                              std::to_string(length) + " byte string");
        }
        value.append(buffer, nread);
        remaining -= nread;
    }
    return value;
}

void write_long(std::ostream& stream, std::int64_t value)
{
    encode_varint(zigzag_encode(value), [&stream](char c) { stream.put(c); });
}

void write_string(std::ostream& stream, std::string const& value)
{
    write_long(stream, static_cast<std::int64_t>(value.size()));
    stream.write(value.data(), static_cast<std::streamsize>(value.size()));
}

} // namespace blocksplit
