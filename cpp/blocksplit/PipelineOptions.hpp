#ifndef BLOCKSPLIT_PIPELINEOPTIONS_HPP
#define BLOCKSPLIT_PIPELINEOPTIONS_HPP

#include "blocksplit/blocksplit_constants.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace blocksplit
{

/**
 * @brief      Class for wrapping the options that govern how sources
 *             are split and read.
 */
class PipelineOptions
{
  public:
    PipelineOptions();
    ~PipelineOptions();
    PipelineOptions(PipelineOptions const&) = delete;

    /**
     * @brief      Get the input file pattern
     */
    std::string const& input_pattern() const;

    /**
     * @brief      Set the input file pattern (may contain * and ?)
     */
    void input_pattern(std::string const&);

    /**
     * @brief      Get the list of explicitly named input files
     */
    std::vector<std::string> const& input_files() const;

    /**
     * @brief      Set the list of explicitly named input files
     */
    void input_files(std::vector<std::string> const&);

    /**
     * @brief      Set the list of input files from a text file
     *
     * @details    File format is a newline separated list of
     *             absolute or relative filepaths. Lines beginning
     *             with # are considered to be comments
     */
    void read_input_file_list(std::string filename);

    /**
     * @brief      Get the bundle size requested from static splitting
     */
    std::uint64_t desired_bundle_size() const;

    /**
     * @brief      Set the bundle size requested from static splitting
     */
    void desired_bundle_size(std::uint64_t);

    /**
     * @brief      Get the minimum bundle size applied to input sources
     */
    std::uint64_t min_bundle_size() const;

    /**
     * @brief      Set the minimum bundle size applied to input sources
     */
    void min_bundle_size(std::uint64_t);

    /**
     * @brief      Get the chunk size used while scanning for sync markers
     */
    std::size_t sync_scan_buffer_size() const;

    /**
     * @brief      Set the chunk size used while scanning for sync markers
     */
    void sync_scan_buffer_size(std::size_t);

    /**
     * @brief      Get the number of reader threads
     */
    unsigned int nthreads() const;

    /**
     * @brief      Set the number of reader threads
     */
    void nthreads(unsigned int);

    /**
     * @brief      Check if in-flight readers may be split to feed idle workers
     */
    bool dynamic_splitting() const;

    /**
     * @brief      Enable or disable dynamic splitting of in-flight readers
     */
    void dynamic_splitting(bool);

    /**
     * @brief      Get the period between straggler checks in milliseconds
     */
    std::size_t split_check_interval_ms() const;

    /**
     * @brief      Set the period between straggler checks in milliseconds
     */
    void split_check_interval_ms(std::size_t);

    /**
     * @brief      Return a description of the options
     */
    std::string to_string() const;

  private:
    std::string _input_pattern;
    std::vector<std::string> _input_files;
    std::uint64_t _desired_bundle_size;
    std::uint64_t _min_bundle_size;
    std::size_t _sync_scan_buffer_size;
    unsigned int _nthreads;
    bool _dynamic_splitting;
    std::size_t _split_check_interval_ms;
};

} // namespace blocksplit

#endif // BLOCKSPLIT_PIPELINEOPTIONS_HPP
