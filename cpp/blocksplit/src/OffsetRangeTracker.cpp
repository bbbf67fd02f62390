#include "blocksplit/OffsetRangeTracker.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace blocksplit
{

OffsetRangeTracker::OffsetRangeTracker(std::uint64_t start, std::uint64_t stop)
    : _start(start), _original_stop(stop), _stop(stop), _done(false)
{
    if(stop < start) {
        throw std::invalid_argument("Invalid range: stop " +
                                    std::to_string(stop) + " < start " +
                                    std::to_string(start));
    }
}

bool OffsetRangeTracker::try_return_record_at(bool is_at_split_point,
                                              std::uint64_t record_start)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if(!_last_record_start && !is_at_split_point) {
        throw std::logic_error(
            "The first record must be at a split point, offset " +
            std::to_string(record_start));
    }
    if(_last_record_start && record_start < *_last_record_start) {
        throw std::logic_error("Records returned out of order: " +
                               std::to_string(record_start) + " after " +
                               std::to_string(*_last_record_start));
    }
    if(is_at_split_point && record_start >= _stop) {
        _done = true;
        return false;
    }
    _last_record_start = record_start;
    return true;
}

void OffsetRangeTracker::mark_done()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _done = true;
}

std::uint64_t OffsetRangeTracker::position_for_fraction(double fraction) const
{
    long double span = static_cast<long double>(_original_stop - _start);
    long double clamped = std::min(fraction, 1.0);
    return _start + static_cast<std::uint64_t>(std::floor(clamped * span));
}

std::optional<OffsetRange>
OffsetRangeTracker::try_split_at_fraction(double fraction)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if(!(fraction > 0.0)) {
        BOOST_LOG_TRIVIAL(debug) << "Refusing split at fraction " << fraction;
        return std::nullopt;
    }
    if(_done) {
        BOOST_LOG_TRIVIAL(debug)
            << "Refusing split at fraction " << fraction
            << ": range already consumed";
        return std::nullopt;
    }
    std::uint64_t candidate = position_for_fraction(fraction);
    if(candidate <= _start) {
        BOOST_LOG_TRIVIAL(debug) << "Refusing split at " << candidate
                                 << ": not after range start " << _start;
        return std::nullopt;
    }
    if(_last_record_start && candidate <= *_last_record_start) {
        BOOST_LOG_TRIVIAL(debug)
            << "Refusing split at " << candidate
            << ": not after last returned record at " << *_last_record_start;
        return std::nullopt;
    }
    if(candidate >= _stop) {
        BOOST_LOG_TRIVIAL(debug) << "Refusing split at " << candidate
                                 << ": not before stop offset " << _stop;
        return std::nullopt;
    }
    OffsetRange residual{candidate, _stop};
    _stop = candidate;
    BOOST_LOG_TRIVIAL(debug) << "Split range [" << _start << ", "
                             << residual.end << ") at " << candidate;
    return residual;
}

double OffsetRangeTracker::fraction_consumed() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    if(_done) {
        return 1.0;
    }
    if(!_last_record_start || _stop == _start) {
        return 0.0;
    }
    double fraction = static_cast<double>(*_last_record_start - _start) /
                      static_cast<double>(_stop - _start);
    return std::clamp(fraction, 0.0, 1.0);
}

std::uint64_t OffsetRangeTracker::start_offset() const
{
    return _start;
}

std::uint64_t OffsetRangeTracker::stop_offset() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _stop;
}

std::uint64_t OffsetRangeTracker::original_stop_offset() const
{
    return _original_stop;
}

std::optional<std::uint64_t> OffsetRangeTracker::last_record_start() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _last_record_start;
}

std::string OffsetRangeTracker::to_string() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    std::ostringstream oss;
    oss << "OffsetRangeTracker[" << _start << ", " << _stop << ")";
    if(_last_record_start) {
        oss << " last record at " << *_last_record_start;
    }
    if(_done) {
        oss << " done";
    }
    return oss.str();
}

} // namespace blocksplit
