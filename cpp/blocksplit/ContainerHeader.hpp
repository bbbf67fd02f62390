#ifndef BLOCKSPLIT_CONTAINERHEADER_HPP
#define BLOCKSPLIT_CONTAINERHEADER_HPP

#include "blocksplit/blocksplit_constants.hpp"

#include <array>
#include <istream>
#include <map>
#include <ostream>
#include <string>

namespace blocksplit
{

typedef std::array<char, BLOCKSPLIT_SYNC_SIZE> SyncMarker;

/**
 * @brief      The self-describing header at the start of every container file
 *
 * @detail     Layout: 4 magic bytes (the last being the format version),
 *             a metadata map from string keys to byte values and the
 *             16-byte sync marker shared by every block of the file.
 */
struct ContainerHeader {
    std::map<std::string, std::string> metadata; // Key-value metadata
    SyncMarker sync_marker{};                    // Block terminator
    std::size_t size = 0; // Bytes occupied by the header on disk

    /**
     * @brief      The codec name, "null" when the header does not name one
     */
    std::string codec() const;

    /**
     * @brief      The JSON writer schema, empty if absent
     */
    std::string schema_json() const;

    std::string to_string() const;
};

/**
 * @brief Parse a container header from the current position of a stream
 *
 * @param stream A binary input stream positioned at the start of a file
 * @param header A ContainerHeader instance
 *
 * @details Throws FormatError on bad magic, an unsupported version or a
 *          truncated header.
 */
void read_container_header(std::istream& stream, ContainerHeader& header);

/**
 * @brief Serialise a container header to a stream
 *
 * @details Sets header.size to the number of bytes written
 */
void write_container_header(std::ostream& stream, ContainerHeader& header);

/**
 * @brief Format a sync marker as hex for logging
 */
std::string to_hex(SyncMarker const& marker);

} // namespace blocksplit

#endif // BLOCKSPLIT_CONTAINERHEADER_HPP
