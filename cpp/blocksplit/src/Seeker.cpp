#include "blocksplit/Seeker.hpp"

#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace blocksplit
{

Seeker::Seeker(std::vector<char> pattern)
    : _pattern(std::move(pattern)), _matched(0)
{
    build_failure_table();
}

Seeker::Seeker(char const* pattern, std::size_t size)
    : Seeker(std::vector<char>(pattern, pattern + size))
{
}

void Seeker::build_failure_table()
{
    if(_pattern.empty()) {
        throw std::invalid_argument("Seeker pattern must not be empty");
    }
    // _failure[i] is the length of the longest proper prefix of
    // _pattern[0..i] that is also a suffix of it
    _failure.assign(_pattern.size(), 0);
    std::size_t k = 0;
    for(std::size_t i = 1; i < _pattern.size(); ++i) {
        while(k > 0 && _pattern[i] != _pattern[k]) { k = _failure[k - 1]; }
        if(_pattern[i] == _pattern[k]) {
            ++k;
        }
        _failure[i] = k;
    }
}

long Seeker::find(char const* buffer, std::size_t length)
{
    for(std::size_t i = 0; i < length; ++i) {
        while(_matched > 0 && buffer[i] != _pattern[_matched]) {
            _matched = _failure[_matched - 1];
        }
        if(buffer[i] == _pattern[_matched]) {
            ++_matched;
        }
        if(_matched == _pattern.size()) {
            _matched = 0;
            return static_cast<long>(i);
        }
    }
    return -1;
}

std::uint64_t advance_past_next_sync_marker(std::istream& stream,
                                            SyncMarker const& marker,
                                            std::size_t buffer_size)
{
    Seeker seeker(marker.data(), marker.size());
    std::vector<char> buffer(buffer_size);
    std::uint64_t consumed = 0;
    while(true) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer_size));
        std::size_t nread = static_cast<std::size_t>(stream.gcount());
        if(nread == 0) {
            BOOST_LOG_TRIVIAL(debug)
                << "No sync marker found after scanning " << consumed
                << " bytes";
            return consumed;
        }
        long idx = seeker.find(buffer.data(), nread);
        if(idx >= 0) {
            std::size_t used   = static_cast<std::size_t>(idx) + 1;
            std::size_t excess = nread - used;
            if(excess > 0) {
                // A short read leaves eofbit set, which would make seekg fail
                stream.clear();
                stream.seekg(-static_cast<std::streamoff>(excess),
                             std::ios_base::cur);
                if(!stream) {
                    throw std::runtime_error(
                        "Unable to return bytes read past the sync marker");
                }
            }
            return consumed + used;
        }
        consumed += nread;
    }
}

} // namespace blocksplit
