#ifndef BLOCKSPLIT_FILEUTILS_HPP
#define BLOCKSPLIT_FILEUTILS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace blocksplit
{

/**
 * @brief      Expand a file pattern (*, ? and [...] wildcards, ~ for home)
 *
 * @return     Matching paths in sorted order, empty if nothing matches
 *
 * @details    Throws std::runtime_error if the expansion itself fails
 */
std::vector<std::string> glob_files(std::string const& pattern);

/**
 * @brief      Size of a file in bytes
 *
 * @details    Throws std::runtime_error if the file cannot be stat'ed
 */
std::uint64_t file_size(std::string const& path);

} // namespace blocksplit

#endif // BLOCKSPLIT_FILEUTILS_HPP
