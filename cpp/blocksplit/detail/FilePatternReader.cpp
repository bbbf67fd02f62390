#include "blocksplit/FilePatternReader.hpp"
#include "blocksplit/FileUtils.hpp"

#include <boost/log/trivial.hpp>
#include <stdexcept>
#include <utility>

namespace blocksplit
{

template <typename T>
FilePatternReader<T>::FilePatternReader(Source<T> const& source,
                                        PipelineOptions const& options)
    : _source(source),
      _sync_scan_buffer_size(options.sync_scan_buffer_size()),
      _current_file_idx(0), _started(false), _done(false)
{
}

template <typename T>
FilePatternReader<T>::~FilePatternReader()
{
    close();
}

template <typename T>
bool FilePatternReader<T>::start()
{
    if(_started) {
        throw std::logic_error("FilePatternReader::start called twice");
    }
    _started = true;
    std::vector<std::string> files = glob_files(_source.file_or_pattern());
    {
        std::lock_guard<std::mutex> lock(_mtx);
        _files = std::move(files);
    }
    BOOST_LOG_TRIVIAL(info) << "Reading " << _files.size()
                            << " files matching " << _source.file_or_pattern();
    _current_file_idx = 0;
    return open_next();
}

template <typename T>
bool FilePatternReader<T>::open_next()
{
    // Move on through the files until one yields a record
    while(_current_file_idx < _files.size()) {
        auto reader = std::make_unique<ContainerReader<T>>(
            _source.create_for_subrange(_files[_current_file_idx],
                                        0,
                                        UNBOUNDED_END),
            _sync_scan_buffer_size);
        BOOST_LOG_TRIVIAL(debug) << "Opening " << _files[_current_file_idx];
        bool has_record = reader->start();
        {
            std::lock_guard<std::mutex> lock(_mtx);
            _current_reader = std::move(reader);
            if(has_record) {
                return true;
            }
            ++_current_file_idx;
        }
    }
    std::lock_guard<std::mutex> lock(_mtx);
    _current_reader.reset();
    _done = true;
    return false;
}

template <typename T>
bool FilePatternReader<T>::advance()
{
    if(!_started) {
        throw std::logic_error("FilePatternReader::advance before start");
    }
    if(_done || !_current_reader) {
        return false;
    }
    if(_current_reader->advance()) {
        return true;
    }
    {
        std::lock_guard<std::mutex> lock(_mtx);
        ++_current_file_idx;
    }
    return open_next();
}

template <typename T>
T const& FilePatternReader<T>::current() const
{
    if(!_current_reader) {
        throw std::logic_error("No current record");
    }
    return _current_reader->current();
}

template <typename T>
double FilePatternReader<T>::fraction_consumed() const
{
    std::lock_guard<std::mutex> lock(_mtx);
    if(_done) {
        return 1.0;
    }
    if(_files.empty()) {
        return 0.0;
    }
    double current = _current_reader ? _current_reader->fraction_consumed() : 0.0;
    return (static_cast<double>(_current_file_idx) + current) /
           static_cast<double>(_files.size());
}

template <typename T>
std::optional<Source<T>> FilePatternReader<T>::split_at_fraction(double fraction)
{
    BOOST_LOG_TRIVIAL(debug) << "Refusing split at fraction " << fraction
                             << " of file pattern "
                             << _source.file_or_pattern();
    return std::nullopt;
}

template <typename T>
Source<T> FilePatternReader<T>::current_source() const
{
    return _source;
}

template <typename T>
void FilePatternReader<T>::close()
{
    std::lock_guard<std::mutex> lock(_mtx);
    if(_current_reader) {
        _current_reader->close();
        _current_reader.reset();
    }
    _done = true;
}

template <typename T>
std::vector<std::string> const& FilePatternReader<T>::files() const
{
    return _files;
}

} // namespace blocksplit
