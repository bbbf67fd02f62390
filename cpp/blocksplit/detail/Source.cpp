#include "blocksplit/Errors.hpp"
#include "blocksplit/FileUtils.hpp"
#include "blocksplit/Source.hpp"

#include <algorithm>
#include <iterator>
#include <boost/log/trivial.hpp>
#include <sstream>
#include <utility>

namespace blocksplit
{

template <typename T>
Source<T>::Source(SourceMode mode,
                  std::string file_or_pattern,
                  std::uint64_t start,
                  std::uint64_t end,
                  std::uint64_t min_bundle_size,
                  SchemaBinding binding)
    : _mode(mode), _file_or_pattern(std::move(file_or_pattern)), _start(start),
      _end(end), _min_bundle_size(min_bundle_size),
      _binding(std::move(binding))
{
}

template <typename T>
SourceMode Source<T>::mode() const
{
    return _mode;
}

template <typename T>
std::string const& Source<T>::file_or_pattern() const
{
    return _file_or_pattern;
}

template <typename T>
std::uint64_t Source<T>::start_offset() const
{
    return _start;
}

template <typename T>
std::uint64_t Source<T>::end_offset() const
{
    return _end;
}

template <typename T>
std::uint64_t Source<T>::min_bundle_size() const
{
    return _min_bundle_size;
}

template <typename T>
SchemaBinding const& Source<T>::schema_binding() const
{
    return _binding;
}

template <typename T>
Source<GenericRecord> Source<T>::with_schema(Schema const& schema) const
{
    return Source<GenericRecord>(_mode,
                                 _file_or_pattern,
                                 _start,
                                 _end,
                                 _min_bundle_size,
                                 schema);
}

template <typename T>
Source<GenericRecord> Source<T>::with_schema(std::string const& json) const
{
    return Source<GenericRecord>(_mode,
                                 _file_or_pattern,
                                 _start,
                                 _end,
                                 _min_bundle_size,
                                 json);
}

template <typename T>
template <typename U>
Source<U> Source<T>::with_schema() const
{
    return Source<U>(_mode,
                     _file_or_pattern,
                     _start,
                     _end,
                     _min_bundle_size,
                     RecordCoder<U>::schema());
}

template <typename T>
Source<T> Source<T>::with_min_bundle_size(std::uint64_t min_bundle_size) const
{
    return Source<T>(_mode,
                     _file_or_pattern,
                     _start,
                     _end,
                     min_bundle_size,
                     _binding);
}

template <typename T>
Source<T> Source<T>::create_for_subrange(std::string const& filename,
                                         std::uint64_t start,
                                         std::uint64_t end) const
{
    return Source<T>(SourceMode::SINGLE_FILE,
                     filename,
                     start,
                     end,
                     _min_bundle_size,
                     _binding);
}

template <typename T>
std::uint64_t Source<T>::resolved_end() const
{
    if(_end == UNBOUNDED_END) {
        return file_size(_file_or_pattern);
    }
    return _end;
}

template <typename T>
std::vector<Source<T>>
Source<T>::split_into_bundles(std::uint64_t desired_bundle_size,
                              PipelineOptions const& options) const
{
    validate();
    std::vector<Source<T>> bundles;
    if(_mode == SourceMode::FILEPATTERN) {
        std::vector<std::string> files = glob_files(_file_or_pattern);
        for(auto const& file: files) {
            auto file_bundles = create_for_subrange(file, 0, UNBOUNDED_END)
                                    .split_into_bundles(desired_bundle_size,
                                                        options);
            std::move(file_bundles.begin(),
                      file_bundles.end(),
                      std::back_inserter(bundles));
        }
        BOOST_LOG_TRIVIAL(info)
            << "Split " << _file_or_pattern << " (" << files.size()
            << " files) into " << bundles.size() << " bundles";
        return bundles;
    }

    std::uint64_t end = resolved_end();
    std::uint64_t bundle_size =
        std::max<std::uint64_t>({desired_bundle_size, _min_bundle_size, 1});
    // A start past the end of the file is a single empty range
    if(_start >= end || end - _start <= bundle_size) {
        bundles.push_back(*this);
        return bundles;
    }
    std::uint64_t offset = _start;
    while(offset < end) {
        std::uint64_t bundle_end = end - offset <= bundle_size
                                       ? end
                                       : offset + bundle_size;
        if(end - bundle_end < _min_bundle_size) {
            bundle_end = end;
        }
        bundles.push_back(create_for_subrange(_file_or_pattern, offset, bundle_end));
        offset = bundle_end;
    }
    BOOST_LOG_TRIVIAL(debug) << "Split " << to_string() << " into "
                             << bundles.size() << " bundles of "
                             << bundle_size << " bytes";
    return bundles;
}

template <typename T>
std::uint64_t Source<T>::estimated_size_bytes() const
{
    if(_mode == SourceMode::FILEPATTERN) {
        std::uint64_t total = 0;
        for(auto const& file: glob_files(_file_or_pattern)) {
            total += file_size(file);
        }
        return total;
    }
    std::uint64_t end = resolved_end();
    return end > _start ? end - _start : 0;
}

template <typename T>
void Source<T>::validate() const
{
    if(_file_or_pattern.empty()) {
        throw ConfigurationError("Source requires a file or file pattern");
    }
    if(_start > _end) {
        std::stringstream error_message;
        error_message << "Invalid source range: start " << _start
                      << " is after end " << _end;
        throw ConfigurationError(error_message.str());
    }
    if(_mode == SourceMode::FILEPATTERN &&
       (_start != 0 || _end != UNBOUNDED_END)) {
        throw ConfigurationError(
            "A file pattern source must cover whole files: " + to_string());
    }
}

template <typename T>
std::unique_ptr<Reader<T>>
Source<T>::create_reader(PipelineOptions const& options) const
{
    validate();
    BOOST_LOG_TRIVIAL(debug) << "Creating reader for " << to_string();
    if(_mode == SourceMode::FILEPATTERN) {
        return std::make_unique<FilePatternReader<T>>(*this, options);
    }
    return std::make_unique<ContainerReader<T>>(*this, options);
}

template <typename T>
std::string Source<T>::to_string() const
{
    std::ostringstream oss;
    oss << "Source[" << blocksplit::to_string(_mode) << " " << _file_or_pattern
        << " [" << _start << ", ";
    if(_end == UNBOUNDED_END) {
        oss << "EOF";
    } else {
        oss << _end;
    }
    oss << ") " << blocksplit::to_string(_binding)
        << ", min bundle " << _min_bundle_size << "]";
    return oss.str();
}

} // namespace blocksplit
