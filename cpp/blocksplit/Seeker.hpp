#ifndef BLOCKSPLIT_SEEKER_HPP
#define BLOCKSPLIT_SEEKER_HPP

#include "blocksplit/ContainerHeader.hpp"
#include "blocksplit/blocksplit_constants.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

namespace blocksplit
{

/**
 * @brief      Finds a fixed byte pattern in data delivered over
 *             successive buffers
 *
 * @detail     Knuth-Morris-Pratt matching. The length of the longest
 *             pattern prefix matched at the end of the previous buffer is
 *             carried into the next call, so a pattern straddling two
 *             buffers is found and no byte is examined twice.
 */
class Seeker
{
  public:
    explicit Seeker(std::vector<char> pattern);
    Seeker(char const* pattern, std::size_t size);

    /**
     * @brief      Search the first length bytes of buffer
     *
     * @return     The index of the last byte of the first complete match,
     *             after which the matcher restarts from an empty prefix,
     *             or -1 if the pattern was not completed in this buffer.
     */
    long find(char const* buffer, std::size_t length);

  private:
    void build_failure_table();

    std::vector<char> _pattern;
    std::vector<std::size_t> _failure;
    std::size_t _matched;
};

/**
 * @brief      Advance a stream to just past the next sync marker
 *
 * @param      stream       Binary stream to scan from its current position
 * @param      marker       The sync marker to look for
 * @param      buffer_size  Number of bytes read from the stream per chunk
 *
 * @return     The number of bytes consumed up to and including the marker.
 *             If the stream ends first, the number of bytes consumed before
 *             the end of the stream.
 *
 * @details    Bytes read past the end of the marker are given back with
 *             seekg so the byte following the marker is the next one
 *             read from the stream.
 */
std::uint64_t advance_past_next_sync_marker(
    std::istream& stream,
    SyncMarker const& marker,
    std::size_t buffer_size = BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE);

} // namespace blocksplit

#endif // BLOCKSPLIT_SEEKER_HPP
