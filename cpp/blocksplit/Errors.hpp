#ifndef BLOCKSPLIT_ERRORS_HPP
#define BLOCKSPLIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace blocksplit
{

/**
 * @brief      Raised for invalid user configuration
 *
 * @details    Unknown codec names, schemas that cannot be parsed and
 *             invalid Source parameters. Never retried.
 */
class ConfigurationError: public std::runtime_error
{
  public:
    explicit ConfigurationError(std::string const& what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @brief      Raised when bytes on disk do not follow the container format
 */
class FormatError: public std::runtime_error
{
  public:
    explicit FormatError(std::string const& what): std::runtime_error(what)
    {
    }
};

} // namespace blocksplit

#endif // BLOCKSPLIT_ERRORS_HPP
