#include "blocksplit/Source.hpp"

namespace blocksplit
{

std::string to_string(SourceMode mode)
{
    switch(mode) {
    case SourceMode::FILEPATTERN:
        return "FILEPATTERN";
    case SourceMode::SINGLE_FILE:
        return "SINGLE_FILE";
    }
    return "UNKNOWN";
}

Source<GenericRecord> from_pattern(std::string const& pattern)
{
    return Source<GenericRecord>(SourceMode::FILEPATTERN,
                                 pattern,
                                 0,
                                 UNBOUNDED_END,
                                 BLOCKSPLIT_DEFAULT_MIN_BUNDLE_SIZE,
                                 std::monostate{});
}

} // namespace blocksplit
