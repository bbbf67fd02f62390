#include "blocksplit/test/SourceTestUtils.hpp"

#include <gtest/gtest.h>
#include <random>

namespace blocksplit
{
namespace test
{

template <typename T>
void generate_test_file(std::string const& path,
                        std::vector<T> const& records,
                        SyncBehavior behavior,
                        std::size_t sync_interval,
                        std::string const& codec)
{
    std::mt19937 rng(0);
    auto next_sync = [&rng, sync_interval]() {
        std::uniform_int_distribution<std::size_t> dist(1, sync_interval);
        return dist(rng);
    };
    ContainerWriter writer(path, RecordCoder<T>::schema(), codec);
    std::size_t record_idx = 0;
    std::size_t sync_idx =
        behavior == SyncBehavior::SYNC_RANDOM ? next_sync() : sync_interval;
    for(auto const& record: records) {
        writer.append(record);
        ++record_idx;
        if(behavior == SyncBehavior::SYNC_DEFAULT || record_idx != sync_idx) {
            continue;
        }
        record_idx = 0;
        writer.sync();
        if(behavior == SyncBehavior::SYNC_RANDOM) {
            sync_idx = next_sync();
        }
    }
    writer.close();
}

template <typename T>
std::vector<T> read_from_source(Source<T> const& source,
                                PipelineOptions const& options)
{
    auto reader = source.create_reader(options);
    return read_remaining_from_reader(*reader, false);
}

template <typename T>
std::vector<T> read_n_items_from_unstarted_reader(Reader<T>& reader,
                                                  std::size_t n)
{
    std::vector<T> records;
    for(std::size_t ii = 0; ii < n; ++ii) {
        bool more = (ii == 0) ? reader.start() : reader.advance();
        if(!more) {
            break;
        }
        records.push_back(reader.current());
    }
    return records;
}

template <typename T>
std::vector<T> read_remaining_from_reader(Reader<T>& reader, bool started)
{
    std::vector<T> records;
    bool more = started ? reader.advance() : reader.start();
    for(; more; more = reader.advance()) { records.push_back(reader.current()); }
    return records;
}

template <typename T>
void assert_sources_equal_reference_source(
    Source<T> const& reference,
    std::vector<Source<T>> const& sources,
    PipelineOptions const& options)
{
    std::vector<T> expected = read_from_source(reference, options);
    std::vector<T> actual;
    for(auto const& source: sources) {
        auto records = read_from_source(source, options);
        actual.insert(actual.end(), records.begin(), records.end());
    }
    ASSERT_EQ(expected.size(), actual.size());
    ASSERT_TRUE(expected == actual)
        << "Records of " << sources.size()
        << " sources differ from the reference " << reference.to_string();
}

template <typename T>
void assert_split_at_fraction_fails(Source<T> const& source,
                                    std::size_t num_items,
                                    double fraction,
                                    PipelineOptions const& options)
{
    auto reader = source.create_reader(options);
    read_n_items_from_unstarted_reader(*reader, num_items);
    auto residual = reader->split_at_fraction(fraction);
    ASSERT_FALSE(residual.has_value())
        << "Split at " << fraction << " after " << num_items
        << " items unexpectedly produced " << residual->to_string();
}

template <typename T>
void assert_split_at_fraction_succeeds_and_consistent(
    Source<T> const& source,
    std::size_t num_items,
    double fraction,
    PipelineOptions const& options)
{
    std::vector<T> expected = read_from_source(source, options);

    auto reader = source.create_reader(options);
    std::vector<T> primary =
        read_n_items_from_unstarted_reader(*reader, num_items);
    auto residual = reader->split_at_fraction(fraction);
    ASSERT_TRUE(residual.has_value()) << "Split at " << fraction << " after "
                                      << num_items << " items was refused";
    ASSERT_EQ(reader->current_source().end_offset(),
              residual->start_offset());

    auto rest = read_remaining_from_reader(*reader, num_items > 0);
    primary.insert(primary.end(), rest.begin(), rest.end());
    auto residual_records = read_from_source(*residual, options);

    std::vector<T> actual(primary);
    actual.insert(actual.end(), residual_records.begin(), residual_records.end());
    ASSERT_EQ(expected.size(), actual.size())
        << "Primary held " << primary.size() << " and residual "
        << residual_records.size() << " records";
    ASSERT_TRUE(expected == actual);
}

template <typename T>
void assert_split_at_fraction_exhaustive(Source<T> const& source,
                                         PipelineOptions const& options)
{
    std::vector<T> expected = read_from_source(source, options);
    std::size_t total_successes = 0;
    for(std::size_t num_items = 0; num_items <= expected.size(); ++num_items) {
        std::size_t successes = 0;
        for(int step = 0; step <= 100; ++step) {
            double fraction = step / 100.0;
            auto reader = source.create_reader(options);
            std::vector<T> actual =
                read_n_items_from_unstarted_reader(*reader, num_items);
            ASSERT_EQ(actual.size(), num_items);
            auto residual = reader->split_at_fraction(fraction);
            if(step == 0) {
                ASSERT_FALSE(residual.has_value());
            }
            auto rest = read_remaining_from_reader(*reader, num_items > 0);
            actual.insert(actual.end(), rest.begin(), rest.end());
            if(residual) {
                ++successes;
                auto residual_records = read_from_source(*residual, options);
                actual.insert(actual.end(),
                              residual_records.begin(),
                              residual_records.end());
            }
            ASSERT_EQ(expected.size(), actual.size())
                << "After " << num_items << " items, split at " << fraction;
            ASSERT_TRUE(expected == actual)
                << "After " << num_items << " items, split at " << fraction;
        }
        if(num_items == 0) {
            // Nothing has been read, so every positive fraction below one
            // lies inside the range
            ASSERT_EQ(successes, 99u);
        }
        total_successes += successes;
    }
    ASSERT_GT(total_successes, 0u);
}

} // namespace test
} // namespace blocksplit
