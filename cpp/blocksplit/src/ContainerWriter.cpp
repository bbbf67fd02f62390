#include "blocksplit/ContainerWriter.hpp"
#include "blocksplit/Block.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <sstream>
#include <stdexcept>

namespace blocksplit
{

namespace
{

SyncMarker random_sync_marker()
{
    boost::uuids::random_generator generator;
    boost::uuids::uuid id = generator();
    static_assert(boost::uuids::uuid::static_size() == BLOCKSPLIT_SYNC_SIZE,
                  "A UUID must fill the sync marker exactly");
    SyncMarker marker;
    std::copy(id.begin(), id.end(), marker.begin());
    return marker;
}

std::string stream_state(std::ofstream const& stream)
{
    if(stream.bad()) {
        return "badbit set.";
    } else if(stream.fail()) {
        return "failbit set.";
    } else if(stream.eof()) {
        return "eofbit set.";
    }
    return "no error bits set.";
}

} // namespace

ContainerWriter::ContainerWriter(std::string const& filename,
                                 Schema const& schema,
                                 std::string const& codec,
                                 std::size_t sync_interval,
                                 std::optional<SyncMarker> marker)
    : _filename(filename), _schema(schema),
      _codec(CodecFactory::create(codec)),
      _sync_interval(std::max<std::size_t>(sync_interval, 1)),
      _pending_records(0), _records_written(0), _bytes_written(0)
{
    _header.metadata[SCHEMA_KEY] = _schema.to_json();
    _header.metadata[CODEC_KEY]  = _codec->name();
    _header.sync_marker = marker ? *marker : random_sync_marker();

    _stream.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    try {
        _stream.open(_filename,
                     std::ofstream::out | std::ofstream::binary |
                         std::ofstream::trunc);
    } catch(std::ofstream::failure const& e) {
        std::stringstream error_message;
        error_message << "Could not open file " << _filename << " ("
                      << e.what() << ")";
        BOOST_LOG_TRIVIAL(error) << error_message.str();
        throw std::runtime_error(error_message.str());
    }
    BOOST_LOG_TRIVIAL(info) << "Opened output file " << _filename;
    try {
        write_container_header(_stream, _header);
    } catch(std::ofstream::failure const& e) {
        BOOST_LOG_TRIVIAL(error)
            << "Error while writing header to " << _filename << " ("
            << e.what() << ") because of reason: " << stream_state(_stream);
        throw;
    }
    _bytes_written = _header.size;
    BOOST_LOG_TRIVIAL(debug) << "Wrote " << _header.to_string();
}

ContainerWriter::~ContainerWriter()
{
    if(_stream.is_open()) {
        try {
            close();
        } catch(std::exception const& e) {
            BOOST_LOG_TRIVIAL(error)
                << "Failed to close " << _filename << ": " << e.what();
        }
    }
}

void ContainerWriter::append(GenericRecord const& record)
{
    if(record.schema() != _schema) {
        throw std::invalid_argument("Record schema " +
                                    record.schema().full_name() +
                                    " does not match writer schema " +
                                    _schema.full_name());
    }
    record.encode(_encoder);
    after_append();
}

void ContainerWriter::append_encoded(std::vector<char> const& encoded_record)
{
    _encoder.write_fixed(encoded_record.data(), encoded_record.size());
    after_append();
}

void ContainerWriter::after_append()
{
    ++_pending_records;
    if(_encoder.size() >= _sync_interval) {
        write_pending_block();
    }
}

void ContainerWriter::write_pending_block()
{
    if(_pending_records == 0) {
        return;
    }
    if(!_stream.is_open()) {
        throw std::logic_error("Write to closed file " + _filename);
    }
    Block block;
    block.record_count = _pending_records;
    block.payload      = _codec->compress(_encoder.buffer());
    try {
        _bytes_written += write_block(_stream, block, _header.sync_marker);
    } catch(std::ofstream::failure const& e) {
        BOOST_LOG_TRIVIAL(error)
            << "Error while writing to " << _filename << " (" << e.what()
            << ") because of reason: " << stream_state(_stream);
        throw;
    }
    BOOST_LOG_TRIVIAL(debug) << "Wrote block of " << _pending_records
                             << " records (" << block.payload.size()
                             << " bytes) to " << _filename;
    _records_written += _pending_records;
    _pending_records = 0;
    _encoder.clear();
}

std::uint64_t ContainerWriter::sync()
{
    write_pending_block();
    return _bytes_written;
}

void ContainerWriter::close()
{
    if(!_stream.is_open()) {
        return;
    }
    write_pending_block();
    BOOST_LOG_TRIVIAL(info) << "Closing file " << _filename << " ("
                            << _records_written << " records, "
                            << _bytes_written << " bytes)";
    _stream.close();
}

std::string const& ContainerWriter::filename() const
{
    return _filename;
}

ContainerHeader const& ContainerWriter::header() const
{
    return _header;
}

std::uint64_t ContainerWriter::bytes_written() const
{
    return _bytes_written;
}

std::int64_t ContainerWriter::records_written() const
{
    return _records_written;
}

} // namespace blocksplit
