#include "blocksplit/PipelineOptions.hpp"
#include "blocksplit/Source.hpp"
#include "blocksplit/logging.hpp"

#include <algorithm>
#include <boost/log/attributes/named_scope.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#define BOOST_LOG_DYN_LINK 1

namespace
{

std::string blocksplit_splash = R"(
 _     _            _              _ _ _
| |__ | | ___   ___| | _____ _ __ | (_) |_
| '_ \| |/ _ \ / __| |/ / __| '_ \| | | __|
| |_) | | (_) | (__|   <\__ \ |_) | | | |_
|_.__/|_|\___/ \___|_|\_\___/ .__/|_|_|\__|
                            |_|
)";
const size_t ERROR_IN_COMMAND_LINE     = 1;
const size_t SUCCESS                   = 0;
const size_t ERROR_UNHANDLED_EXCEPTION = 2;

const char* build_time = __DATE__ " " __TIME__;

using RecordSource = blocksplit::Source<blocksplit::GenericRecord>;
using RecordReader = blocksplit::Reader<blocksplit::GenericRecord>;

struct BundleResult {
    std::string description;
    std::size_t nrecords;
};

/**
 * Reader running on a worker, with the range it was started on so that
 * split fractions can be expressed against the original range.
 */
struct ActiveRead {
    RecordReader* reader = nullptr;
    std::uint64_t start  = 0;
    std::uint64_t end    = 0;
};

/**
 * Reads bundles on a pool of worker threads. With dynamic splitting
 * enabled a monitor thread splits running readers while workers sit
 * idle and queues the residuals.
 */
class BundleRunner
{
  public:
    BundleRunner(blocksplit::PipelineOptions const& options, bool dump)
        : _options(options), _dump(dump), _busy(0),
          _active(std::max(options.nthreads(), 1u)), _finished(false)
    {
    }

    void run(std::vector<RecordSource> const& bundles)
    {
        _queue.assign(bundles.begin(), bundles.end());
        std::vector<std::thread> workers;
        for(std::size_t ii = 0; ii < _active.size(); ++ii) {
            workers.emplace_back(&BundleRunner::work, this, ii);
        }
        std::thread monitor;
        if(_options.dynamic_splitting()) {
            monitor = std::thread(&BundleRunner::monitor, this);
        }
        for(auto& worker: workers) { worker.join(); }
        {
            std::lock_guard<std::mutex> lock(_mtx);
            _finished = true;
        }
        _cv.notify_all();
        if(monitor.joinable()) {
            monitor.join();
        }
        if(_error) {
            std::rethrow_exception(_error);
        }
    }

    std::vector<BundleResult> const& results() const { return _results; }

  private:
    void work(std::size_t worker_idx)
    {
        BOOST_LOG_NAMED_SCOPE("worker");
        while(true) {
            std::optional<RecordSource> source;
            {
                std::unique_lock<std::mutex> lock(_mtx);
                _cv.wait(lock, [this] {
                    return !_queue.empty() || _busy == 0 || _error;
                });
                if(_error || _queue.empty()) {
                    _cv.notify_all();
                    return;
                }
                source.emplace(_queue.front());
                _queue.pop_front();
                ++_busy;
            }
            try {
                read_bundle(worker_idx, *source);
            } catch(std::exception const& e) {
                BOOST_LOG_TRIVIAL(error)
                    << "Failed to read " << source->to_string() << ": "
                    << e.what();
                std::lock_guard<std::mutex> lock(_mtx);
                if(!_error) {
                    _error = std::current_exception();
                }
            }
            {
                std::lock_guard<std::mutex> lock(_mtx);
                --_busy;
            }
            _cv.notify_all();
        }
    }

    void read_bundle(std::size_t worker_idx, RecordSource const& source)
    {
        std::unique_ptr<RecordReader> reader = source.create_reader(_options);
        std::size_t nrecords = 0;
        bool more            = reader->start();
        {
            RecordSource range = reader->current_source();
            std::lock_guard<std::mutex> lock(_mtx);
            _active[worker_idx] = ActiveRead{reader.get(),
                                             range.start_offset(),
                                             range.end_offset()};
        }
        try {
            for(; more; more = reader->advance()) {
                ++nrecords;
                if(_dump) {
                    std::lock_guard<std::mutex> lock(_output_mtx);
                    std::cout << reader->current().to_string() << "\n";
                }
            }
        } catch(std::exception const&) {
            // Deregister before the reader is destroyed by unwinding
            std::lock_guard<std::mutex> lock(_mtx);
            _active[worker_idx] = ActiveRead();
            throw;
        }
        RecordSource final_source = reader->current_source();
        reader->close();
        std::lock_guard<std::mutex> lock(_mtx);
        _active[worker_idx] = ActiveRead();
        _results.push_back(BundleResult{final_source.to_string(), nrecords});
        BOOST_LOG_TRIVIAL(debug)
            << "Read " << nrecords << " records from " << final_source.to_string();
    }

    void monitor()
    {
        BOOST_LOG_NAMED_SCOPE("monitor");
        auto const interval =
            std::chrono::milliseconds(_options.split_check_interval_ms());
        std::unique_lock<std::mutex> lock(_mtx);
        while(!_finished) {
            _cv.wait_for(lock, interval, [this] { return _finished; });
            if(_finished) {
                break;
            }
            std::size_t idle = _active.size() - _busy;
            if(idle == 0 || !_queue.empty()) {
                continue;
            }
            // Readers are only deregistered under _mtx, so the pointers
            // stay valid while it is held
            for(auto const& read: _active) {
                if(idle == 0) {
                    break;
                }
                if(read.reader == nullptr || read.end <= read.start) {
                    continue;
                }
                RecordSource current = read.reader->current_source();
                double consumed      = read.reader->fraction_consumed();
                double position =
                    current.start_offset() +
                    consumed * (current.end_offset() - current.start_offset());
                double midpoint = (position + current.end_offset()) / 2.0;
                double fraction = (midpoint - read.start) /
                                  static_cast<double>(read.end - read.start);
                auto residual = read.reader->split_at_fraction(fraction);
                if(residual) {
                    BOOST_LOG_TRIVIAL(info)
                        << "Rebalanced " << residual->to_string()
                        << " to an idle worker";
                    _queue.push_back(*residual);
                    --idle;
                }
            }
            if(!_queue.empty()) {
                _cv.notify_all();
            }
        }
    }

    blocksplit::PipelineOptions const& _options;
    bool _dump;
    std::size_t _busy;
    std::vector<ActiveRead> _active;
    std::deque<RecordSource> _queue;
    std::vector<BundleResult> _results;
    std::exception_ptr _error;
    bool _finished;
    std::mutex _mtx;
    std::mutex _output_mtx;
    std::condition_variable _cv;
};

} // namespace

int main(int argc, char** argv)
{
    std::cout << blocksplit_splash;
    std::cout << "Build time: " << build_time << std::endl;

    blocksplit::PipelineOptions options;
    bool dump = false;

    namespace po = boost::program_options;

    po::options_description generic("Generic options");
    generic.add_options()("cfg,c",
                          po::value<std::string>()->default_value(""),
                          "blocksplit configuration file");

    po::options_description main_options("Main options");
    main_options.add_options()("help,h", "Produce help message")(
        "input,i",
        po::value<std::string>()
            ->default_value(options.input_pattern())
            ->notifier(
                [&options](std::string key) { options.input_pattern(key); }),
        "File pattern of the container files to read (may contain * and ?)")(
        "input-file-list,f",
        po::value<std::string>()->default_value("")->notifier(
            [&options](std::string key) {
                if(!key.empty()) {
                    options.read_input_file_list(key);
                }
            }),
        "File containing a newline separated list of input files")(
        "bundle-size",
        po::value<std::uint64_t>()
            ->default_value(options.desired_bundle_size())
            ->notifier([&options](std::uint64_t key) {
                options.desired_bundle_size(key);
            }),
        "The desired size of each bundle in bytes")(
        "min-bundle-size",
        po::value<std::uint64_t>()
            ->default_value(options.min_bundle_size())
            ->notifier(
                [&options](std::uint64_t key) { options.min_bundle_size(key); }),
        "The minimum size of each bundle in bytes")(
        "nthreads",
        po::value<unsigned int>()
            ->default_value(options.nthreads())
            ->notifier([&options](unsigned int key) { options.nthreads(key); }),
        "The number of reader threads")(
        "dynamic-splitting",
        po::value<bool>()
            ->default_value(options.dynamic_splitting())
            ->notifier(
                [&options](bool key) { options.dynamic_splitting(key); }),
        "Split running readers to feed idle threads")(
        "split-check-interval-ms",
        po::value<std::size_t>()
            ->default_value(options.split_check_interval_ms())
            ->notifier([&options](std::size_t key) {
                options.split_check_interval_ms(key);
            }),
        "Period between checks for straggling readers")(
        "sync-scan-buffer-size",
        po::value<std::size_t>()
            ->default_value(options.sync_scan_buffer_size())
            ->notifier([&options](std::size_t key) {
                options.sync_scan_buffer_size(key);
            }),
        "Chunk size used when scanning for sync markers")(
        "dump",
        po::bool_switch(&dump),
        "Print every record read to stdout")(
        "log-level",
        po::value<std::string>()->default_value("info")->notifier(
            [](std::string level) { blocksplit::init_logging(level); }),
        "The logging level to use (debug, info, warning, error)");

    po::options_description cmdline_options;
    cmdline_options.add(generic).add(main_options);

    // set options allowed in config file
    po::options_description config_file_options;
    config_file_options.add(main_options);
    po::variables_map variable_map;
    try {
        po::store(
            po::command_line_parser(argc, argv).options(cmdline_options).run(),
            variable_map);
        if(variable_map.count("help")) {
            std::cout << "blocksplit -- Reads container files in parallel "
                         "bundles and reports the records in each."
                      << std::endl
                      << cmdline_options << std::endl;
            return SUCCESS;
        }

        auto config_file = variable_map.at("cfg").as<std::string>();
        if(config_file != "") {
            std::ifstream config_fs(config_file.c_str());
            if(!config_fs.is_open()) {
                std::cerr << "Unable to open configuration file: "
                          << config_file << " (" << std::strerror(errno)
                          << ")\n";
                return ERROR_UNHANDLED_EXCEPTION;
            }
            po::store(po::parse_config_file(config_fs, config_file_options),
                      variable_map);
        }
        po::notify(variable_map);
    } catch(po::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        return ERROR_IN_COMMAND_LINE;
    } catch(std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return ERROR_IN_COMMAND_LINE;
    }

    BOOST_LOG_NAMED_SCOPE("blocksplit_cli");
    BOOST_LOG_TRIVIAL(info) << options.to_string();

    std::vector<std::string> inputs = options.input_files();
    if(!options.input_pattern().empty()) {
        inputs.push_back(options.input_pattern());
    }
    if(inputs.empty()) {
        std::cerr << "ERROR: no input given, use --input or --input-file-list"
                  << std::endl;
        return ERROR_IN_COMMAND_LINE;
    }

    try {
        std::vector<RecordSource> bundles;
        for(auto const& input: inputs) {
            RecordSource source = blocksplit::from_pattern(input)
                                      .with_min_bundle_size(
                                          options.min_bundle_size());
            auto split = source.split_into_bundles(
                options.desired_bundle_size(), options);
            bundles.insert(bundles.end(), split.begin(), split.end());
        }
        BOOST_LOG_TRIVIAL(info) << "Reading " << bundles.size()
                                << " bundles on " << options.nthreads()
                                << " threads";

        BundleRunner runner(options, dump);
        runner.run(bundles);

        std::size_t total = 0;
        for(auto const& result: runner.results()) {
            std::cout << result.description << ": " << result.nrecords
                      << " records" << std::endl;
            total += result.nrecords;
        }
        std::cout << "Total: " << total << " records in "
                  << runner.results().size() << " bundles" << std::endl;
    } catch(std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << e.what();
        return ERROR_UNHANDLED_EXCEPTION;
    }
    return SUCCESS;
}
