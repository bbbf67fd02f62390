#ifndef BLOCKSPLIT_FILEPATTERNREADER_HPP
#define BLOCKSPLIT_FILEPATTERNREADER_HPP

#include "blocksplit/ContainerReader.hpp"
#include "blocksplit/PipelineOptions.hpp"
#include "blocksplit/Source.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blocksplit
{

/**
 * @brief      Reads every file matched by a FILEPATTERN Source, one after
 *             another in sorted order
 *
 * @detail     Each file is read by its own ContainerReader over the whole
 *             file. Dynamic splits are refused.
 */
template <typename T>
class FilePatternReader: public Reader<T>
{
  public:
    FilePatternReader(Source<T> const& source, PipelineOptions const& options);
    FilePatternReader(FilePatternReader const&) = delete;
    ~FilePatternReader() override;

    bool start() override;
    bool advance() override;
    T const& current() const override;

    /**
     * @brief      Files completed plus the progress of the current file,
     *             over the number of files
     */
    double fraction_consumed() const override;
    std::optional<Source<T>> split_at_fraction(double fraction) override;
    Source<T> current_source() const override;
    void close() override;

    std::vector<std::string> const& files() const;

  private:
    bool open_next();

    Source<T> _source;
    std::size_t _sync_scan_buffer_size;
    std::vector<std::string> _files;
    std::size_t _current_file_idx;
    std::unique_ptr<ContainerReader<T>> _current_reader;
    mutable std::mutex _mtx;
    bool _started;
    bool _done;
};

} // namespace blocksplit

#include "blocksplit/detail/FilePatternReader.cpp"

#endif // BLOCKSPLIT_FILEPATTERNREADER_HPP
