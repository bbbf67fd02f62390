#include "blocksplit/Codec.hpp"
#include "blocksplit/Errors.hpp"
#include "blocksplit/blocksplit_constants.hpp"

#include <boost/log/trivial.hpp>
#include <stdexcept>
#include <string>
#include <zlib.h>

namespace blocksplit
{
namespace
{

// Negative window bits select a raw deflate stream without zlib framing
constexpr int RAW_DEFLATE_WINDOW_BITS = -MAX_WBITS;
constexpr std::size_t ZLIB_CHUNK_SIZE   = 16384;

std::string zlib_message(z_stream const& stream, int ret)
{
    return stream.msg ? std::string(stream.msg)
                      : "zlib error code " + std::to_string(ret);
}

} // namespace

Codec::~Codec()
{
}

std::string NullCodec::name() const
{
    return NULL_CODEC;
}

std::vector<char> NullCodec::compress(std::vector<char> const& data) const
{
    return data;
}

std::vector<char> NullCodec::decompress(std::vector<char> const& data) const
{
    return data;
}

DeflateCodec::DeflateCodec(int level): _level(level)
{
}

std::string DeflateCodec::name() const
{
    return DEFLATE_CODEC;
}

std::vector<char> DeflateCodec::compress(std::vector<char> const& data) const
{
    z_stream stream{};
    int ret = deflateInit2(&stream,
                           _level,
                           Z_DEFLATED,
                           RAW_DEFLATE_WINDOW_BITS,
                           8,
                           Z_DEFAULT_STRATEGY);
    if(ret != Z_OK) {
        std::string message = "deflateInit2 failed: " + zlib_message(stream, ret);
        BOOST_LOG_TRIVIAL(error) << message;
        throw std::runtime_error(message);
    }
    std::vector<char> output;
    std::vector<char> chunk(ZLIB_CHUNK_SIZE);
    stream.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    do {
        stream.next_out  = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret              = deflate(&stream, Z_FINISH);
        if(ret == Z_STREAM_ERROR) {
            std::string message = "deflate failed: " + zlib_message(stream, ret);
            deflateEnd(&stream);
            BOOST_LOG_TRIVIAL(error) << message;
            throw std::runtime_error(message);
        }
        output.insert(output.end(),
                      chunk.data(),
                      chunk.data() + (chunk.size() - stream.avail_out));
    } while(ret != Z_STREAM_END);
    deflateEnd(&stream);
    BOOST_LOG_TRIVIAL(debug) << "Deflated " << data.size() << " bytes to "
                             << output.size();
    return output;
}

std::vector<char> DeflateCodec::decompress(std::vector<char> const& data) const
{
    z_stream stream{};
    int ret = inflateInit2(&stream, RAW_DEFLATE_WINDOW_BITS);
    if(ret != Z_OK) {
        throw std::runtime_error("inflateInit2 failed: " +
                                 zlib_message(stream, ret));
    }
    std::vector<char> output;
    std::vector<char> chunk(ZLIB_CHUNK_SIZE);
    stream.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    while(ret != Z_STREAM_END) {
        stream.next_out  = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret              = inflate(&stream, Z_NO_FLUSH);
        if(ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
           ret == Z_STREAM_ERROR) {
            std::string message = zlib_message(stream, ret);
            inflateEnd(&stream);
            throw FormatError("Corrupt deflate payload: " + message);
        }
        std::size_t produced = chunk.size() - stream.avail_out;
        output.insert(output.end(), chunk.data(), chunk.data() + produced);
        if(ret == Z_BUF_ERROR || (stream.avail_in == 0 && produced == 0 &&
                                  ret != Z_STREAM_END)) {
            inflateEnd(&stream);
            throw FormatError("Truncated deflate payload");
        }
    }
    inflateEnd(&stream);
    return output;
}

std::unique_ptr<Codec> CodecFactory::create(std::string const& name)
{
    std::lock_guard<std::mutex> lock(registry_mutex());
    auto it = registry().find(name);
    if(it == registry().end()) {
        throw ConfigurationError("Unsupported codec: '" + name + "'");
    }
    return it->second();
}

void CodecFactory::register_codec(std::string const& name, Creator creator)
{
    std::lock_guard<std::mutex> lock(registry_mutex());
    BOOST_LOG_TRIVIAL(debug) << "Registering codec " << name;
    registry()[name] = std::move(creator);
}

bool CodecFactory::is_registered(std::string const& name)
{
    std::lock_guard<std::mutex> lock(registry_mutex());
    return registry().count(name) > 0;
}

std::map<std::string, CodecFactory::Creator>& CodecFactory::registry()
{
    static std::map<std::string, Creator> codecs = {
        {NULL_CODEC, []() { return std::make_unique<NullCodec>(); }},
        {DEFLATE_CODEC, []() {
             return std::make_unique<DeflateCodec>(
                 BLOCKSPLIT_DEFAULT_DEFLATE_LEVEL);
         }}};
    return codecs;
}

std::mutex& CodecFactory::registry_mutex()
{
    static std::mutex mutex;
    return mutex;
}

} // namespace blocksplit
