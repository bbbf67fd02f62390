#include "blocksplit/BlockReader.hpp"
#include "blocksplit/FileUtils.hpp"
#include "blocksplit/Seeker.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace blocksplit
{

BlockReader::BlockReader(std::string const& filename,
                         std::uint64_t start,
                         std::uint64_t end,
                         std::size_t scan_buffer_size)
    : _filename(filename), _scan_buffer_size(scan_buffer_size),
      _file_size(blocksplit::file_size(filename)),
      _tracker(start, std::max(start, std::min(end, _file_size))),
      _is_open(false),
      _block_start(0), _next_block_start(0)
{
}

BlockReader::~BlockReader()
{
    close();
}

void BlockReader::open()
{
    _stream.open(_filename, std::ifstream::in | std::ifstream::binary);
    if(!_stream.is_open()) {
        std::stringstream error_message;
        error_message << "Could not open file " << _filename << " ("
                      << std::strerror(errno) << ")";
        BOOST_LOG_TRIVIAL(error) << error_message.str();
        throw std::runtime_error(error_message.str());
    }
    _is_open = true;

    // Every reader needs the marker and codec, wherever its range starts
    read_container_header(_stream, _header);
    _codec = CodecFactory::create(_header.codec());

    std::uint64_t start = _tracker.start_offset();
    if(start == 0) {
        _next_block_start = _header.size;
    } else {
        // Back off by one marker length so a marker ending exactly at
        // the range start is found and its block kept in this range
        std::uint64_t origin =
            start > BLOCKSPLIT_SYNC_SIZE ? start - BLOCKSPLIT_SYNC_SIZE : 0;
        _stream.seekg(static_cast<std::streamoff>(origin), std::ios_base::beg);
        std::uint64_t consumed = advance_past_next_sync_marker(
            _stream, _header.sync_marker, _scan_buffer_size);
        _next_block_start = origin + consumed;
        if(_next_block_start >= _file_size) {
            BOOST_LOG_TRIVIAL(debug)
                << "No block starts in " << _filename << " at or after "
                << start;
        }
    }
    _stream.clear();
    _stream.seekg(static_cast<std::streamoff>(_next_block_start),
                  std::ios_base::beg);
    BOOST_LOG_TRIVIAL(debug) << "Opened " << _filename << " for range ["
                             << start << ", " << _tracker.stop_offset()
                             << "), first block at " << _next_block_start;
}

bool BlockReader::read_next_block()
{
    if(!_is_open) {
        throw std::logic_error("BlockReader::read_next_block on closed reader");
    }
    while(true) {
        if(_next_block_start >= _file_size) {
            _tracker.mark_done();
            return false;
        }
        if(!_tracker.try_return_record_at(true, _next_block_start)) {
            BOOST_LOG_TRIVIAL(debug)
                << "Block at " << _next_block_start << " is past stop offset "
                << _tracker.stop_offset() << " of " << _filename;
            return false;
        }
        std::size_t consumed = read_block(_stream,
                                          _file_size - _next_block_start,
                                          _header.sync_marker,
                                          _block);
        _block_start = _next_block_start;
        _next_block_start += consumed;
        if(_block.record_count == 0) {
            continue;
        }
        _payload = _codec->decompress(_block.payload);
        _decoder =
            std::make_unique<BinaryDecoder>(_payload.data(), _payload.size());
        return true;
    }
}

void BlockReader::close()
{
    if(_stream.is_open()) {
        _stream.close();
    }
    _is_open = false;
}

bool BlockReader::is_open() const
{
    return _is_open;
}

ContainerHeader const& BlockReader::header() const
{
    return _header;
}

BinaryDecoder& BlockReader::block_decoder()
{
    if(!_decoder) {
        throw std::logic_error("No block has been read");
    }
    return *_decoder;
}

std::int64_t BlockReader::block_record_count() const
{
    return _block.record_count;
}

std::uint64_t BlockReader::block_start() const
{
    return _block_start;
}

std::optional<OffsetRange> BlockReader::try_split_at_fraction(double fraction)
{
    return _tracker.try_split_at_fraction(fraction);
}

double BlockReader::fraction_consumed() const
{
    return _tracker.fraction_consumed();
}

std::string const& BlockReader::filename() const
{
    return _filename;
}

std::uint64_t BlockReader::start_offset() const
{
    return _tracker.start_offset();
}

std::uint64_t BlockReader::stop_offset() const
{
    return _tracker.stop_offset();
}

std::uint64_t BlockReader::file_size() const
{
    return _file_size;
}

} // namespace blocksplit
