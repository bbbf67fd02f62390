#ifndef BLOCKSPLIT_CONTAINERWRITER_HPP
#define BLOCKSPLIT_CONTAINERWRITER_HPP

#include "blocksplit/BinaryEncoding.hpp"
#include "blocksplit/Codec.hpp"
#include "blocksplit/ContainerHeader.hpp"
#include "blocksplit/GenericRecord.hpp"
#include "blocksplit/RecordCoder.hpp"
#include "blocksplit/Schema.hpp"
#include "blocksplit/blocksplit_constants.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blocksplit
{

/**
 * @brief      Writes records to a new container file
 *
 * @detail     Encoded records are buffered until the buffer reaches the sync
 *             interval, then compressed with the codec and written as one
 *             block followed by the sync marker of the file.
 */
class ContainerWriter
{
  public:
    /**
     * @brief      Create a new container file
     *
     * @param      filename       Path of the file, truncated if it exists
     * @param      schema         The writer schema stored in the header
     * @param      codec          Registered codec name for block payloads
     * @param      sync_interval  Uncompressed bytes buffered per block
     * @param      marker         The sync marker, random if not given
     */
    ContainerWriter(std::string const& filename,
                    Schema const& schema,
                    std::string const& codec  = NULL_CODEC,
                    std::size_t sync_interval = BLOCKSPLIT_DEFAULT_SYNC_INTERVAL,
                    std::optional<SyncMarker> marker = std::nullopt);
    ContainerWriter(ContainerWriter const&) = delete;
    ~ContainerWriter();

    /**
     * @brief      Append a generic record
     *
     * @details    Throws std::invalid_argument if the record's schema is
     *             not the writer schema
     */
    void append(GenericRecord const& record);

    /**
     * @brief      Append a typed record encoded through RecordCoder<T>
     */
    template <typename T>
    void append(T const& record);

    /**
     * @brief      Append one record that is already encoded
     */
    void append_encoded(std::vector<char> const& encoded_record);

    /**
     * @brief      End the current block
     *
     * @return     The file offset just past the sync marker, i.e. the start
     *             of the next block
     */
    std::uint64_t sync();

    /**
     * @brief      Write any buffered records and close the file
     */
    void close();

    std::string const& filename() const;
    ContainerHeader const& header() const;
    std::uint64_t bytes_written() const;
    std::int64_t records_written() const;

  private:
    void write_pending_block();
    void after_append();

    std::string _filename;
    Schema _schema;
    std::unique_ptr<Codec> _codec;
    std::size_t _sync_interval;
    ContainerHeader _header;
    std::ofstream _stream;
    BinaryEncoder _encoder;
    std::int64_t _pending_records;
    std::int64_t _records_written;
    std::uint64_t _bytes_written;
};

} // namespace blocksplit

#include "blocksplit/detail/ContainerWriter.cpp"

#endif // BLOCKSPLIT_CONTAINERWRITER_HPP
