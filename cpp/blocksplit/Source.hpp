#ifndef BLOCKSPLIT_SOURCE_HPP
#define BLOCKSPLIT_SOURCE_HPP

#include "blocksplit/GenericRecord.hpp"
#include "blocksplit/PipelineOptions.hpp"
#include "blocksplit/RecordCoder.hpp"
#include "blocksplit/Schema.hpp"
#include "blocksplit/blocksplit_constants.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blocksplit
{

enum class SourceMode
{
    FILEPATTERN, // Every file matched by a pattern, read in sorted order
    SINGLE_FILE  // A byte range of one file
};

std::string to_string(SourceMode mode);

template <typename T>
class Reader;

/**
 * @brief      An immutable description of records stored in container files
 *
 * @detail     A Source names a file pattern or a byte range [start, end) of
 *             one file, the binding used to decode its records and the
 *             smallest bundle static splitting may produce. A range end of
 *             UNBOUNDED_END means the end of the file. Records belong to
 *             the Source whose range holds the start offset of their block,
 *             so sources cut at arbitrary byte offsets still partition the
 *             records of the file exactly.
 *
 *             Configuration methods never modify a Source, they return a
 *             new one.
 *
 * @tparam     T     The record type produced by readers of this Source
 */
template <typename T>
class Source
{
  public:
    Source(SourceMode mode,
           std::string file_or_pattern,
           std::uint64_t start,
           std::uint64_t end,
           std::uint64_t min_bundle_size,
           SchemaBinding binding);

    SourceMode mode() const;
    std::string const& file_or_pattern() const;
    std::uint64_t start_offset() const;

    /**
     * @brief      The range end as given, possibly UNBOUNDED_END
     */
    std::uint64_t end_offset() const;
    std::uint64_t min_bundle_size() const;
    SchemaBinding const& schema_binding() const;

    /**
     * @brief      Decode records with a given schema instead of the file schema
     */
    Source<GenericRecord> with_schema(Schema const& schema) const;

    /**
     * @brief      Decode records with a JSON schema, parsed when a reader opens
     */
    Source<GenericRecord> with_schema(std::string const& json) const;

    /**
     * @brief      Decode records as U through RecordCoder<U>
     */
    template <typename U>
    Source<U> with_schema() const;

    Source<T> with_min_bundle_size(std::uint64_t min_bundle_size) const;

    /**
     * @brief      A SINGLE_FILE source over [start, end) of a file, keeping the
     *             schema binding and minimum bundle size
     */
    Source<T> create_for_subrange(std::string const& filename,
                                  std::uint64_t start,
                                  std::uint64_t end) const;

    /**
     * @brief      Split into contiguous byte ranges before reading starts
     *
     * @param      desired_bundle_size  Requested bytes per bundle
     * @param      options              Pipeline options
     *
     * @details    Bundles hold at least max(desired_bundle_size,
     *             min_bundle_size) bytes except the last of each file. A
     *             tail shorter than the minimum bundle size is merged
     *             into the preceding bundle. FILEPATTERN sources are
     *             expanded and split file by file in sorted order.
     */
    std::vector<Source<T>> split_into_bundles(std::uint64_t desired_bundle_size,
                                              PipelineOptions const& options) const;

    /**
     * @brief      Total bytes covered by the source
     */
    std::uint64_t estimated_size_bytes() const;

    /**
     * @brief      Check the source parameters
     *
     * @details    Throws ConfigurationError for an inverted range or a
     *             FILEPATTERN source that is not over whole files
     */
    void validate() const;

    /**
     * @brief      Create a reader for this source
     *
     * @details    The reader is not started; call Reader::start.
     */
    std::unique_ptr<Reader<T>> create_reader(PipelineOptions const& options) const;

    std::string to_string() const;

  private:
    std::uint64_t resolved_end() const;

    SourceMode _mode;
    std::string _file_or_pattern;
    std::uint64_t _start;
    std::uint64_t _end;
    std::uint64_t _min_bundle_size;
    SchemaBinding _binding;
};

/**
 * @brief      A Source over every file matching a pattern
 *
 * @details    No schema is bound; records are GenericRecords decoded with
 *             the writer schema of each file.
 */
Source<GenericRecord> from_pattern(std::string const& pattern);

/**
 * @brief      Sequential cursor over the records of one Source
 *
 * @detail     One thread drives start/advance/current. fraction_consumed,
 *             split_at_fraction and current_source may be called from any
 *             other thread while the reader runs.
 */
template <typename T>
class Reader
{
  public:
    virtual ~Reader() {}

    /**
     * @brief      Open the source and move to the first record
     *
     * @return     False if the source holds no records
     */
    virtual bool start() = 0;

    /**
     * @brief      Move to the next record
     *
     * @return     False once the (possibly split) range is exhausted
     */
    virtual bool advance() = 0;

    /**
     * @brief      The record at the cursor
     *
     * @details    Throws std::logic_error if there is none
     */
    virtual T const& current() const = 0;

    virtual double fraction_consumed() const = 0;

    /**
     * @brief      Give up the unread part of the range past a fraction of it
     *
     * @return     The residual Source, or nullopt if the split was refused.
     *             On success this reader stops at the start of the residual.
     */
    virtual std::optional<Source<T>> split_at_fraction(double fraction) = 0;

    /**
     * @brief      The source as narrowed by successful splits
     */
    virtual Source<T> current_source() const = 0;

    virtual void close() = 0;
};

template <typename T>
class ContainerReader;

template <typename T>
class FilePatternReader;

} // namespace blocksplit

#include "blocksplit/ContainerReader.hpp"
#include "blocksplit/FilePatternReader.hpp"
#include "blocksplit/detail/Source.cpp"

#endif // BLOCKSPLIT_SOURCE_HPP
