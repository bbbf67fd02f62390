#ifndef BLOCKSPLIT_OFFSETRANGETRACKER_HPP
#define BLOCKSPLIT_OFFSETRANGETRACKER_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace blocksplit
{

/**
 * @brief      A half-open byte range [start, end)
 */
struct OffsetRange {
    std::uint64_t start;
    std::uint64_t end;
};

/**
 * @brief      Tracks the progress of a reader through a byte range and
 *             arbitrates dynamic splits of the unread remainder
 *
 * @detail     The reading thread reports the offset of each record it is
 *             about to return. Records at split points (block starts)
 *             are refused once they lie at or past the stop offset. A
 *             control thread may concurrently move the stop offset
 *             towards the last returned record. All state is guarded
 *             by one mutex so every report and every split is a single
 *             atomic check-and-update.
 */
class OffsetRangeTracker
{
  public:
    OffsetRangeTracker(std::uint64_t start, std::uint64_t stop);
    OffsetRangeTracker(OffsetRangeTracker const&) = delete;

    /**
     * @brief      Report the start offset of the next record
     *
     * @param      is_at_split_point  True if a new reader could start at
     *                                this record (the first record of a
     *                                block)
     * @param      record_start       Offset at which the record starts
     *
     * @return     False if the record lies beyond the current stop offset
     *             and the reader must finish.
     *
     * @details    Throws std::logic_error if offsets go backwards or the
     *             first record is not at a split point.
     */
    bool try_return_record_at(bool is_at_split_point,
                              std::uint64_t record_start);

    /**
     * @brief      Mark the tracker as exhausted so no further split is
     *             accepted
     */
    void mark_done();

    /**
     * @brief      Try to shrink the range at the given fraction of its
     *             original size
     *
     * @return     The residual range given up by the reader, or nullopt if
     *             the split was rejected. A rejected split changes nothing.
     */
    std::optional<OffsetRange> try_split_at_fraction(double fraction);

    /**
     * @brief      Fraction of the current range consumed, in [0, 1]
     */
    double fraction_consumed() const;

    std::uint64_t start_offset() const;
    std::uint64_t stop_offset() const;
    std::uint64_t original_stop_offset() const;

    /**
     * @brief      Offset of the last record returned, or nullopt before the
     *             first record
     */
    std::optional<std::uint64_t> last_record_start() const;

    std::string to_string() const;

  private:
    std::uint64_t position_for_fraction(double fraction) const;

    mutable std::mutex _mutex;
    std::uint64_t const _start;
    std::uint64_t const _original_stop;
    std::uint64_t _stop;
    std::optional<std::uint64_t> _last_record_start;
    bool _done;
};

} // namespace blocksplit

#endif // BLOCKSPLIT_OFFSETRANGETRACKER_HPP
