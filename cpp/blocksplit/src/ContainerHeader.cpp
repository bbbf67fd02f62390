#include "blocksplit/ContainerHeader.hpp"
#include "blocksplit/BinaryEncoding.hpp"
#include "blocksplit/Errors.hpp"

#include <boost/log/trivial.hpp>
#include <cstring>
#include <limits>
#include <iomanip>
#include <sstream>

namespace blocksplit
{

std::string ContainerHeader::codec() const
{
    auto it = metadata.find(CODEC_KEY);
    return it == metadata.end() ? std::string(NULL_CODEC) : it->second;
}

std::string ContainerHeader::schema_json() const
{
    auto it = metadata.find(SCHEMA_KEY);
    return it == metadata.end() ? std::string() : it->second;
}

std::string ContainerHeader::to_string() const
{
    std::ostringstream oss;
    oss << "ContainerHeader:\n"
        << "  size: " << size << "\n"
        << "  codec: " << codec() << "\n"
        << "  sync_marker: " << to_hex(sync_marker) << "\n";
    for(auto const& entry: metadata) {
        if(entry.first == CODEC_KEY) {
            continue;
        }
        oss << "  " << entry.first << ": " << entry.second << "\n";
    }
    return oss.str();
}

void read_container_header(std::istream& stream, ContainerHeader& header)
{
    std::streampos begin = stream.tellg();
    char magic[MAGIC_SIZE];
    stream.read(magic, MAGIC_SIZE);
    if(static_cast<std::size_t>(stream.gcount()) != MAGIC_SIZE) {
        throw FormatError("Not a container file: too short for magic bytes");
    }
    if(std::memcmp(magic, MAGIC, MAGIC_SIZE - 1) != 0) {
        throw FormatError("Not a container file: bad magic bytes");
    }
    if(magic[MAGIC_SIZE - 1] != MAGIC[MAGIC_SIZE - 1]) {
        throw FormatError("Unsupported container format version: " +
                          std::to_string(static_cast<int>(magic[MAGIC_SIZE - 1])));
    }

    header.metadata.clear();
    // The map is a series of blocks terminated by an empty one; a
    // negative count is followed by the block size in bytes
    while(true) {
        std::int64_t count = read_long(stream);
        if(count == 0) {
            break;
        }
        if(count == std::numeric_limits<std::int64_t>::min()) {
            throw FormatError("Corrupt metadata map block count");
        }
        if(count < 0) {
            count = -count;
            read_long(stream);
        }
        for(std::int64_t ii = 0; ii < count; ++ii) {
            std::string key    = read_string(stream);
            std::string value  = read_string(stream);
            header.metadata[key] = value;
        }
    }

    stream.read(header.sync_marker.data(), BLOCKSPLIT_SYNC_SIZE);
    if(stream.gcount() != BLOCKSPLIT_SYNC_SIZE) {
        throw FormatError("Truncated container header: missing sync marker");
    }
    header.size = static_cast<std::size_t>(stream.tellg() - begin);
    BOOST_LOG_TRIVIAL(debug) << "Read container header of " << header.size
                             << " bytes, codec " << header.codec()
                             << ", sync marker " << to_hex(header.sync_marker);
}

void write_container_header(std::ostream& stream, ContainerHeader& header)
{
    std::streampos begin = stream.tellp();
    stream.write(MAGIC, MAGIC_SIZE);
    if(!header.metadata.empty()) {
        write_long(stream, static_cast<std::int64_t>(header.metadata.size()));
        for(auto const& entry: header.metadata) {
            write_string(stream, entry.first);
            write_string(stream, entry.second);
        }
    }
    write_long(stream, 0);
    stream.write(header.sync_marker.data(), BLOCKSPLIT_SYNC_SIZE);
    header.size = static_cast<std::size_t>(stream.tellp() - begin);
}

std::string to_hex(SyncMarker const& marker)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for(char c: marker) {
        oss << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
    }
    return oss.str();
}

} // namespace blocksplit
