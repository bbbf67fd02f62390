#ifndef BLOCKSPLIT_CONSTANTS_HPP
#define BLOCKSPLIT_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>
#include <limits>

/**
 * CONSTANTS FOR BLOCKSPLIT
 *
 * The container layout constants below are fixed by the file format
 * and must not be changed. The tuning defaults can be overridden at
 * build time, e.g.
 *
 * cmake -S . -B build/ -DBLOCKSPLIT_DEFAULT_SYNC_INTERVAL=16000
 *
 */

/**
 * The number of bytes in the synchronisation marker that terminates
 * each block and closes the file header.
 */
#define BLOCKSPLIT_SYNC_SIZE 16

/**
 * The only container format version understood by the readers.
 */
#define BLOCKSPLIT_FORMAT_VERSION 1

/**
 * The number of bytes of uncompressed record data buffered by a
 * writer before a block is emitted.
 */
#ifndef BLOCKSPLIT_DEFAULT_SYNC_INTERVAL
    #define BLOCKSPLIT_DEFAULT_SYNC_INTERVAL 64000
#endif // BLOCKSPLIT_DEFAULT_SYNC_INTERVAL

/**
 * The smallest bundle a Source is split into unless configured
 * otherwise. Two sync intervals keeps most bundles holding at least
 * one complete block.
 */
#ifndef BLOCKSPLIT_DEFAULT_MIN_BUNDLE_SIZE
    #define BLOCKSPLIT_DEFAULT_MIN_BUNDLE_SIZE \
        (2 * BLOCKSPLIT_DEFAULT_SYNC_INTERVAL)
#endif // BLOCKSPLIT_DEFAULT_MIN_BUNDLE_SIZE

/**
 * Chunk size used when scanning a stream for the next sync marker.
 */
#ifndef BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE
    #define BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE 4096
#endif // BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE
static_assert(BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE > 0,
              "BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE must be positive");

/**
 * Default deflate level used by writers (1-9).
 */
#ifndef BLOCKSPLIT_DEFAULT_DEFLATE_LEVEL
    #define BLOCKSPLIT_DEFAULT_DEFLATE_LEVEL 6
#endif // BLOCKSPLIT_DEFAULT_DEFLATE_LEVEL

namespace blocksplit
{

constexpr char MAGIC[] = {'O', 'b', 'j', BLOCKSPLIT_FORMAT_VERSION};
constexpr std::size_t MAGIC_SIZE = sizeof(MAGIC);

constexpr char const* SCHEMA_KEY = "avro.schema";
constexpr char const* CODEC_KEY  = "avro.codec";

constexpr char const* NULL_CODEC    = "null";
constexpr char const* DEFLATE_CODEC = "deflate";

// Marks a Source range that extends to the end of its file
constexpr std::uint64_t UNBOUNDED_END =
    std::numeric_limits<std::uint64_t>::max();

} // namespace blocksplit

#endif // BLOCKSPLIT_CONSTANTS_HPP
