#include "blocksplit/Block.hpp"
#include "blocksplit/BinaryEncoding.hpp"
#include "blocksplit/Errors.hpp"

#include <boost/log/trivial.hpp>
#include <sstream>

namespace blocksplit
{

std::size_t read_block(std::istream& stream,
                       std::uint64_t bytes_remaining,
                       SyncMarker const& marker,
                       Block& block)
{
    std::streampos begin  = stream.tellg();
    std::streamoff offset = begin;
    std::int64_t count    = read_long(stream);
    std::int64_t length   = read_long(stream);
    if(count < 0 || length < 0) {
        std::stringstream error_message;
        error_message << "Invalid block framing at offset " << offset
                      << ": record count " << count << ", payload length "
                      << length;
        throw FormatError(error_message.str());
    }
    std::uint64_t framing = static_cast<std::uint64_t>(stream.tellg() - begin);
    if(framing > bytes_remaining ||
       static_cast<std::uint64_t>(length) > bytes_remaining - framing) {
        std::stringstream error_message;
        error_message << "Truncated block at offset " << offset
                      << ": declares " << length << " payload bytes but only "
                      << (bytes_remaining > framing ? bytes_remaining - framing
                                                    : 0)
                      << " remain";
        throw FormatError(error_message.str());
    }

    block.record_count = count;
    block.payload.resize(static_cast<std::size_t>(length));
    stream.read(block.payload.data(), length);
    if(stream.gcount() != length) {
        throw FormatError("Truncated block payload at offset " +
                          std::to_string(offset));
    }

    SyncMarker trailing;
    stream.read(trailing.data(), BLOCKSPLIT_SYNC_SIZE);
    if(stream.gcount() != BLOCKSPLIT_SYNC_SIZE) {
        throw FormatError("Truncated block at offset " +
                          std::to_string(offset) +
                          ": missing sync marker");
    }
    if(trailing != marker) {
        throw FormatError("Invalid sync marker after block at offset " +
                          std::to_string(offset) +
                          ": found " + to_hex(trailing) + ", expected " +
                          to_hex(marker));
    }
    std::size_t consumed = static_cast<std::size_t>(stream.tellg() - begin);
    BOOST_LOG_TRIVIAL(debug) << "Read block at offset " << offset << " with "
                             << count << " records in " << consumed
                             << " bytes";
    return consumed;
}

std::size_t
write_block(std::ostream& stream, Block const& block, SyncMarker const& marker)
{
    std::streampos begin = stream.tellp();
    write_long(stream, block.record_count);
    write_long(stream, static_cast<std::int64_t>(block.payload.size()));
    stream.write(block.payload.data(),
                 static_cast<std::streamsize>(block.payload.size()));
    stream.write(marker.data(), BLOCKSPLIT_SYNC_SIZE);
    return static_cast<std::size_t>(stream.tellp() - begin);
}

} // namespace blocksplit
