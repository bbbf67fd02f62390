#include "blocksplit/PipelineOptions.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace blocksplit
{

PipelineOptions::PipelineOptions()
    : _input_pattern(""), _input_files({}), _desired_bundle_size(64 << 20),
      _min_bundle_size(BLOCKSPLIT_DEFAULT_MIN_BUNDLE_SIZE),
      _sync_scan_buffer_size(BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE), _nthreads(1),
      _dynamic_splitting(false), _split_check_interval_ms(100)
{
}

PipelineOptions::~PipelineOptions()
{
}

std::string const& PipelineOptions::input_pattern() const
{
    return _input_pattern;
}

void PipelineOptions::input_pattern(std::string const& pattern)
{
    _input_pattern = pattern;
}

std::vector<std::string> const& PipelineOptions::input_files() const
{
    return _input_files;
}

void PipelineOptions::input_files(std::vector<std::string> const& files)
{
    _input_files = files;
}

void PipelineOptions::read_input_file_list(std::string filename)
{
    BOOST_LOG_TRIVIAL(debug) << "Reading input file list from " << filename;
    std::string line;
    std::ifstream ifs(filename.c_str());
    if(!ifs.is_open()) {
        std::stringstream error_message;
        error_message << "Unable to open input file list: " << filename
                      << " (" << std::strerror(errno) << ")";
        BOOST_LOG_TRIVIAL(error) << error_message.str();
        throw std::runtime_error(error_message.str());
    }
    _input_files.resize(0);
    while(std::getline(ifs, line)) {
        boost::algorithm::trim(line);
        if(line.empty() || line[0] == '#') {
            BOOST_LOG_TRIVIAL(debug) << "Skipping comment or empty line";
            continue;
        }
        BOOST_LOG_TRIVIAL(debug) << "Input file: " << line;
        _input_files.push_back(line);
    }
    ifs.close();
}

std::uint64_t PipelineOptions::desired_bundle_size() const
{
    return _desired_bundle_size;
}

void PipelineOptions::desired_bundle_size(std::uint64_t nbytes)
{
    _desired_bundle_size = nbytes;
}

std::uint64_t PipelineOptions::min_bundle_size() const
{
    return _min_bundle_size;
}

void PipelineOptions::min_bundle_size(std::uint64_t nbytes)
{
    _min_bundle_size = nbytes;
}

std::size_t PipelineOptions::sync_scan_buffer_size() const
{
    return _sync_scan_buffer_size;
}

void PipelineOptions::sync_scan_buffer_size(std::size_t nbytes)
{
    if(nbytes == 0) {
        throw std::invalid_argument(
            "The sync scan buffer size must be greater than zero");
    }
    _sync_scan_buffer_size = nbytes;
}

unsigned int PipelineOptions::nthreads() const
{
    return _nthreads;
}

void PipelineOptions::nthreads(unsigned int n)
{
    _nthreads = n;
}

bool PipelineOptions::dynamic_splitting() const
{
    return _dynamic_splitting;
}

void PipelineOptions::dynamic_splitting(bool enable)
{
    _dynamic_splitting = enable;
}

std::size_t PipelineOptions::split_check_interval_ms() const
{
    return _split_check_interval_ms;
}

void PipelineOptions::split_check_interval_ms(std::size_t ms)
{
    _split_check_interval_ms = ms;
}

std::string PipelineOptions::to_string() const
{
    std::ostringstream oss;
    oss << "PipelineOptions:\n"
        << "  input_pattern: " << _input_pattern << "\n"
        << "  input_files: " << _input_files.size() << "\n"
        << "  desired_bundle_size: " << _desired_bundle_size << "\n"
        << "  min_bundle_size: " << _min_bundle_size << "\n"
        << "  sync_scan_buffer_size: " << _sync_scan_buffer_size << "\n"
        << "  nthreads: " << _nthreads << "\n"
        << "  dynamic_splitting: " << std::boolalpha << _dynamic_splitting
        << "\n"
        << "  split_check_interval_ms: " << _split_check_interval_ms << "\n";
    return oss.str();
}

} // namespace blocksplit
