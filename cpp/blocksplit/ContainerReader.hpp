#ifndef BLOCKSPLIT_CONTAINERREADER_HPP
#define BLOCKSPLIT_CONTAINERREADER_HPP

#include "blocksplit/BlockReader.hpp"
#include "blocksplit/PipelineOptions.hpp"
#include "blocksplit/RecordCoder.hpp"
#include "blocksplit/Source.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace blocksplit
{

/**
 * @brief      Reads the records of a SINGLE_FILE Source
 *
 * @detail     Blocks are located and framed by a BlockReader; the records
 *             of each block are decoded with the decoder resolved from
 *             the schema binding when the reader starts. Splitting is
 *             delegated to the range tracker of the BlockReader, so a
 *             split may be requested from another thread at any time.
 */
template <typename T>
class ContainerReader: public Reader<T>
{
  public:
    ContainerReader(Source<T> const& source, PipelineOptions const& options);
    ContainerReader(Source<T> const& source, std::size_t sync_scan_buffer_size);
    ContainerReader(ContainerReader const&) = delete;
    ~ContainerReader() override;

    bool start() override;
    bool advance() override;
    T const& current() const override;
    double fraction_consumed() const override;
    std::optional<Source<T>> split_at_fraction(double fraction) override;
    Source<T> current_source() const override;
    void close() override;

    /**
     * @brief      The header of the file, available once started
     */
    ContainerHeader const& header() const;

    /**
     * @brief      Offset of the block holding the current record
     */
    std::uint64_t current_block_start() const;

  private:
    Source<T> _source;
    BlockReader _block_reader;
    std::unique_ptr<RecordDecoder<T>> _decoder;
    std::int64_t _records_remaining;
    std::optional<T> _current;
    bool _started;
};

} // namespace blocksplit

#include "blocksplit/detail/ContainerReader.cpp"

#endif // BLOCKSPLIT_CONTAINERREADER_HPP
