#ifndef BLOCKSPLIT_BLOCKREADER_HPP
#define BLOCKSPLIT_BLOCKREADER_HPP

#include "blocksplit/BinaryEncoding.hpp"
#include "blocksplit/Block.hpp"
#include "blocksplit/Codec.hpp"
#include "blocksplit/ContainerHeader.hpp"
#include "blocksplit/OffsetRangeTracker.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blocksplit
{

/**
 * @brief      Sequentially reads the blocks of one container file whose
 *             start offsets fall in a byte range
 *
 * @detail     A block belongs to the range holding its start offset, the
 *             offset just past the preceding sync marker (or the end of
 *             the header). Opening at a nonzero offset scans forward for
 *             the first marker that ends at or after the range start.
 *             Before each block the tracker is consulted, so a stop
 *             offset moved by a concurrent split is honoured at the next
 *             block boundary. A block that starts before the stop offset
 *             is always read to its end.
 */
class BlockReader
{
  public:
    /**
     * @brief      Create a reader for [start, end) of a file
     *
     * @param      filename          The container file
     * @param      start             First byte of the range
     * @param      end               One past the last byte of the range,
     *                               clamped to the file size
     * @param      scan_buffer_size  Chunk size for sync marker scanning
     */
    BlockReader(std::string const& filename,
                std::uint64_t start,
                std::uint64_t end,
                std::size_t scan_buffer_size);
    ~BlockReader();
    BlockReader(BlockReader const&) = delete;

    /**
     * @brief      Open the file, validate its header and align to the first
     *             block of the range
     */
    void open();

    /**
     * @brief      Load the next non-empty block of the range
     *
     * @return     False once the range (or the file) is exhausted
     */
    bool read_next_block();

    void close();
    bool is_open() const;

    ContainerHeader const& header() const;

    /**
     * @brief      Decoder over the decompressed payload of the current block
     */
    BinaryDecoder& block_decoder();
    std::int64_t block_record_count() const;
    std::uint64_t block_start() const;

    /**
     * @brief      Split the unread part of the range
     *
     * @return     The residual range, or nullopt if the split was rejected
     */
    std::optional<OffsetRange> try_split_at_fraction(double fraction);
    double fraction_consumed() const;

    std::string const& filename() const;
    std::uint64_t start_offset() const;
    std::uint64_t stop_offset() const;
    std::uint64_t file_size() const;

  private:
    std::string _filename;
    std::size_t _scan_buffer_size;
    std::uint64_t _file_size;
    OffsetRangeTracker _tracker;
    std::ifstream _stream;
    bool _is_open;
    ContainerHeader _header;
    std::unique_ptr<Codec> _codec;
    Block _block;
    std::vector<char> _payload;
    std::unique_ptr<BinaryDecoder> _decoder;
    std::uint64_t _block_start;
    std::uint64_t _next_block_start;
};

} // namespace blocksplit

#endif // BLOCKSPLIT_BLOCKREADER_HPP
