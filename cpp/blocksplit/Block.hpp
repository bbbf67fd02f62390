#ifndef BLOCKSPLIT_BLOCK_HPP
#define BLOCKSPLIT_BLOCK_HPP

#include "blocksplit/ContainerHeader.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

namespace blocksplit
{

/**
 * @brief      One framed block of a container file
 *
 * @detail     On disk: record count, payload length, payload (as written
 *             by the codec) and the sync marker of the file.
 */
struct Block {
    std::int64_t record_count = 0; // Records serialised in the payload
    std::vector<char> payload;     // Payload bytes before decompression
};

/**
 * @brief Read one block, including its trailing sync marker
 *
 * @param stream           A binary stream positioned at a block start
 * @param bytes_remaining  The number of bytes between the stream position
 *                         and the end of the file
 * @param marker           The sync marker from the file header
 * @param block            The block to fill
 *
 * @return The number of bytes consumed from the stream
 *
 * @details Throws FormatError for negative counts or lengths, a payload
 *          longer than bytes_remaining, a truncated block or a trailing
 *          marker that differs from the header's.
 */
std::size_t read_block(std::istream& stream,
                       std::uint64_t bytes_remaining,
                       SyncMarker const& marker,
                       Block& block);

/**
 * @brief Write one block followed by the sync marker
 *
 * @return The number of bytes written
 */
std::size_t
write_block(std::ostream& stream, Block const& block, SyncMarker const& marker);

} // namespace blocksplit

#endif // BLOCKSPLIT_BLOCK_HPP
