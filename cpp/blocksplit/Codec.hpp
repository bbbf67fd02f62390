#ifndef BLOCKSPLIT_CODEC_HPP
#define BLOCKSPLIT_CODEC_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace blocksplit
{

/**
 * @brief      Block payload compression selected by the codec name
 *             recorded in the container header
 */
class Codec
{
  public:
    virtual ~Codec();

    virtual std::string name() const = 0;
    virtual std::vector<char> compress(std::vector<char> const& data) const = 0;

    /**
     * @brief      Restore a block payload
     *
     * @details    Throws FormatError if the data is not a valid
     *             stream for this codec.
     */
    virtual std::vector<char>
    decompress(std::vector<char> const& data) const = 0;
};

/**
 * @brief      Payloads stored as-is
 */
class NullCodec: public Codec
{
  public:
    std::string name() const override;
    std::vector<char> compress(std::vector<char> const& data) const override;
    std::vector<char> decompress(std::vector<char> const& data) const override;
};

/**
 * @brief      Raw deflate (RFC 1951, no zlib header or checksum)
 */
class DeflateCodec: public Codec
{
  public:
    explicit DeflateCodec(int level);

    std::string name() const override;
    std::vector<char> compress(std::vector<char> const& data) const override;
    std::vector<char> decompress(std::vector<char> const& data) const override;

  private:
    int _level;
};

/**
 * @brief      Registry mapping codec names to codec instances
 *
 * @details    null and deflate are registered by default; further
 *             codecs may be plugged in with register_codec.
 */
class CodecFactory
{
  public:
    typedef std::function<std::unique_ptr<Codec>()> Creator;

    /**
     * @brief      Create a codec by name
     *
     * @details    Throws ConfigurationError for unregistered names
     */
    static std::unique_ptr<Codec> create(std::string const& name);

    static void register_codec(std::string const& name, Creator creator);
    static bool is_registered(std::string const& name);

  private:
    static std::map<std::string, Creator>& registry();
    static std::mutex& registry_mutex();
};

} // namespace blocksplit

#endif // BLOCKSPLIT_CODEC_HPP
