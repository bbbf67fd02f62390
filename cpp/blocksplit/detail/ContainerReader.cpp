#include "blocksplit/ContainerReader.hpp"

#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace blocksplit
{

template <typename T>
ContainerReader<T>::ContainerReader(Source<T> const& source,
                                    PipelineOptions const& options)
    : ContainerReader(source, options.sync_scan_buffer_size())
{
}

template <typename T>
ContainerReader<T>::ContainerReader(Source<T> const& source,
                                    std::size_t sync_scan_buffer_size)
    : _source(source),
      _block_reader(source.file_or_pattern(),
                    source.start_offset(),
                    source.end_offset(),
                    sync_scan_buffer_size),
      _records_remaining(0), _started(false)
{
}

template <typename T>
ContainerReader<T>::~ContainerReader()
{
    close();
}

template <typename T>
bool ContainerReader<T>::start()
{
    if(_started) {
        throw std::logic_error("ContainerReader::start called twice");
    }
    _started = true;
    _block_reader.open();
    _decoder = make_record_decoder<T>(_source.schema_binding(),
                                      _block_reader.header());
    return advance();
}

template <typename T>
bool ContainerReader<T>::advance()
{
    if(!_started) {
        throw std::logic_error("ContainerReader::advance before start");
    }
    while(_records_remaining == 0) {
        if(!_block_reader.read_next_block()) {
            _current.reset();
            return false;
        }
        _records_remaining = _block_reader.block_record_count();
    }
    BinaryDecoder& decoder = _block_reader.block_decoder();
    _current.emplace(_decoder->decode(decoder));
    --_records_remaining;
    if(_records_remaining == 0 && decoder.remaining() != 0) {
        BOOST_LOG_TRIVIAL(warning)
            << decoder.remaining() << " undecoded bytes at the end of block "
            << _block_reader.block_start() << " of " << _source.file_or_pattern();
    }
    return true;
}

template <typename T>
T const& ContainerReader<T>::current() const
{
    if(!_current) {
        throw std::logic_error("No current record");
    }
    return *_current;
}

template <typename T>
double ContainerReader<T>::fraction_consumed() const
{
    return _block_reader.fraction_consumed();
}

template <typename T>
std::optional<Source<T>> ContainerReader<T>::split_at_fraction(double fraction)
{
    std::optional<OffsetRange> residual =
        _block_reader.try_split_at_fraction(fraction);
    if(!residual) {
        return std::nullopt;
    }
    BOOST_LOG_TRIVIAL(info) << "Split " << _source.file_or_pattern() << " at "
                            << residual->start << ", residual ["
                            << residual->start << ", " << residual->end << ")";
    return _source.create_for_subrange(_source.file_or_pattern(),
                                       residual->start,
                                       residual->end);
}

template <typename T>
Source<T> ContainerReader<T>::current_source() const
{
    return _source.create_for_subrange(_source.file_or_pattern(),
                                       _block_reader.start_offset(),
                                       _block_reader.stop_offset());
}

template <typename T>
void ContainerReader<T>::close()
{
    _block_reader.close();
    _current.reset();
}

template <typename T>
ContainerHeader const& ContainerReader<T>::header() const
{
    return _block_reader.header();
}

template <typename T>
std::uint64_t ContainerReader<T>::current_block_start() const
{
    return _block_reader.block_start();
}

} // namespace blocksplit
