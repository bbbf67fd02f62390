#include "blocksplit/ContainerWriter.hpp"

namespace blocksplit
{

template <typename T>
void ContainerWriter::append(T const& record)
{
    RecordCoder<T>::encode(record, _encoder);
    after_append();
}

} // namespace blocksplit
