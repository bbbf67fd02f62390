#include "blocksplit/FileUtils.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <cstring>
#include <filesystem>
#include <glob.h>
#include <stdexcept>
#include <system_error>

namespace blocksplit
{

std::vector<std::string> glob_files(std::string const& pattern)
{
    glob_t glob_result;
    std::memset(&glob_result, 0, sizeof(glob_result));

    int result = glob(pattern.c_str(), GLOB_TILDE, NULL, &glob_result);
    if(result == GLOB_NOMATCH) {
        globfree(&glob_result);
        BOOST_LOG_TRIVIAL(warning) << "No files matched pattern " << pattern;
        return {};
    }
    if(result != 0) {
        globfree(&glob_result);
        std::string reason;
        switch(result) {
        case GLOB_NOSPACE:
            reason = "out of memory";
            break;
        case GLOB_ABORTED:
            reason = "read error";
            break;
        default:
            reason = "unknown error";
            break;
        }
        BOOST_LOG_TRIVIAL(error)
            << "Failed to glob files for " << pattern << ": " << reason;
        throw std::runtime_error("Failed to expand file pattern " + pattern +
                                 ": " + reason);
    }

    std::vector<std::string> filenames;
    for(std::size_t i = 0; i < glob_result.gl_pathc; ++i) {
        filenames.push_back(std::string(glob_result.gl_pathv[i]));
    }
    globfree(&glob_result);
    // glob(3) sorts by the current collation; pin the order to bytes
    std::sort(filenames.begin(), filenames.end());
    BOOST_LOG_TRIVIAL(debug) << "Pattern " << pattern << " matched "
                             << filenames.size() << " files";
    return filenames;
}

std::uint64_t file_size(std::string const& path)
{
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if(ec) {
        BOOST_LOG_TRIVIAL(error)
            << "Could not stat file " << path << " (" << ec.message() << ")";
        throw std::runtime_error("Could not stat file " + path + ": " +
                                 ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

} // namespace blocksplit
