#include "blocksplit/test/SeekerTester.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace blocksplit
{
namespace test
{

SeekerTester::SeekerTester(): ::testing::Test()
{
}

SeekerTester::~SeekerTester()
{
}

void SeekerTester::SetUp()
{
}

void SeekerTester::TearDown()
{
}

namespace
{

long find(Seeker& seeker, std::vector<char> const& buffer)
{
    return seeker.find(buffer.data(), buffer.size());
}

SyncMarker const test_marker =
    {1, 2, 3, 4, 5, 6, 7, 8, 9, 0, 1, 2, 3, 4, 5, 6};

/**
 * Place the marker at position in a zeroed haystack of size bytes,
 * followed by a sentinel byte if there is room, and check the scanner
 * stops right after the marker.
 */
void check_advance_past_marker_at(std::size_t position,
                                  std::size_t size,
                                  std::size_t buffer_size)
{
    char const sentinel = static_cast<char>(0xFF);
    std::string haystack(size, '\0');
    for(std::size_t ii = position, jj = 0;
        ii < size && jj < test_marker.size();
        ++ii, ++jj) {
        haystack[ii] = test_marker[jj];
    }
    std::size_t marker_end = position + test_marker.size();
    if(marker_end < size) {
        haystack[marker_end] = sentinel;
    }
    std::istringstream stream(haystack);
    std::uint64_t consumed =
        advance_past_next_sync_marker(stream, test_marker, buffer_size);
    if(marker_end < size) {
        EXPECT_EQ(consumed, marker_end)
            << "marker at " << position << ", buffer " << buffer_size;
        EXPECT_EQ(stream.get(), static_cast<unsigned char>(sentinel))
            << "marker at " << position << ", buffer " << buffer_size;
    } else {
        EXPECT_EQ(consumed, size)
            << "marker at " << position << ", buffer " << buffer_size;
        EXPECT_EQ(stream.get(), std::char_traits<char>::eof())
            << "marker at " << position << ", buffer " << buffer_size;
    }
}

} // namespace

TEST_F(SeekerTester, test_find)
{
    Seeker seeker(std::vector<char>{0, 1, 2, 3});
    EXPECT_EQ(find(seeker, {0, 1, 2, 3, 4, 5, 6, 7}), 3);
    EXPECT_EQ(find(seeker, {0, 0, 0, 0, 0, 1, 2, 3}), 7);
    EXPECT_EQ(find(seeker, {0, 1, 2, 0, 0, 1, 2, 3}), 7);
    EXPECT_EQ(find(seeker, {0, 1, 2, 3}), 3);
}

TEST_F(SeekerTester, test_find_resume)
{
    Seeker seeker(std::vector<char>{0, 1, 2, 3});
    EXPECT_EQ(find(seeker, {0, 0, 0, 0, 0, 0, 0, 0}), -1);
    EXPECT_EQ(find(seeker, {1, 2, 3, 0, 0, 0, 0, 0}), 2);

    EXPECT_EQ(find(seeker, {0, 0, 0, 0, 0, 0, 1, 2}), -1);
    EXPECT_EQ(find(seeker, {3, 0, 1, 2, 3, 0, 1, 2}), 0);

    EXPECT_EQ(find(seeker, {0}), -1);
    EXPECT_EQ(find(seeker, {1}), -1);
    EXPECT_EQ(find(seeker, {2}), -1);
    EXPECT_EQ(find(seeker, {3}), 0);
}

TEST_F(SeekerTester, test_find_uses_buffer_length)
{
    std::vector<char> marker{0, 0, 1};
    std::vector<char> buffer;
    {
        Seeker seeker(marker);
        buffer = {0, 0, 0, 1};
        EXPECT_EQ(seeker.find(buffer.data(), 3), -1);
    }
    {
        Seeker seeker(marker);
        buffer = {0, 0};
        EXPECT_EQ(seeker.find(buffer.data(), 1), -1);
        buffer = {1, 0};
        EXPECT_EQ(seeker.find(buffer.data(), 1), -1);
    }
    {
        Seeker seeker(marker);
        buffer = {0, 2};
        EXPECT_EQ(seeker.find(buffer.data(), 1), -1);
        buffer = {0, 2};
        EXPECT_EQ(seeker.find(buffer.data(), 1), -1);
        buffer = {1, 2};
        EXPECT_EQ(seeker.find(buffer.data(), 1), 0);
    }
}

TEST_F(SeekerTester, test_find_partial)
{
    {
        Seeker seeker(std::vector<char>{0, 0, 1});
        EXPECT_EQ(find(seeker, {0, 0, 0, 1}), 3);
    }
    {
        Seeker seeker(std::vector<char>{1, 1, 1, 2});
        EXPECT_EQ(find(seeker, {1, 1, 1, 1, 1}), -1);
        EXPECT_EQ(find(seeker, {1, 1, 2}), 2);
        EXPECT_EQ(find(seeker, {1, 1, 1, 1, 1}), -1);
        EXPECT_EQ(find(seeker, {2, 1, 1, 1, 2}), 0);
    }
}

TEST_F(SeekerTester, test_find_all_locations)
{
    Seeker seeker(std::vector<char>{1, 1, 2});
    std::vector<char> const all_ones{1, 1, 1, 1};
    std::vector<char> find_in{1, 1, 1, 1};
    for(std::size_t ii = 0; ii < find_in.size(); ++ii) {
        EXPECT_EQ(find(seeker, all_ones), -1);
        find_in[ii] = 2;
        EXPECT_EQ(find(seeker, find_in), static_cast<long>(ii));
        find_in[ii] = 1;
    }
}

TEST_F(SeekerTester, test_empty_pattern_rejected)
{
    EXPECT_THROW(Seeker seeker(std::vector<char>{}), std::invalid_argument);
}

TEST_F(SeekerTester, test_advance_past_next_sync_marker)
{
    // Marker near the start and in the middle of the data
    for(std::size_t ii = 0; ii <= 16; ++ii) {
        check_advance_past_marker_at(ii, 1000, BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE);
        check_advance_past_marker_at(160 + ii,
                                     1000,
                                     BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE);
    }
    // Marker ending at the last byte
    check_advance_past_marker_at(983, 1000, BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE);
    // Marker cut off by the end of the data
    check_advance_past_marker_at(984, 1000, BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE);
    check_advance_past_marker_at(985, 1000, BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE);
    check_advance_past_marker_at(999, 1000, BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE);
    // No marker at all
    check_advance_past_marker_at(1000, 1000, BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE);
}

TEST_F(SeekerTester, test_advance_past_next_sync_marker_small_buffers)
{
    // Buffers smaller than, equal to and not dividing the marker length
    // force matches that straddle reads
    for(std::size_t buffer_size: {1u, 7u, 16u, 17u, 100u}) {
        for(std::size_t ii = 0; ii <= 16; ++ii) {
            check_advance_past_marker_at(ii, 1000, buffer_size);
            check_advance_past_marker_at(160 + ii, 1000, buffer_size);
        }
        check_advance_past_marker_at(983, 1000, buffer_size);
        check_advance_past_marker_at(984, 1000, buffer_size);
        check_advance_past_marker_at(1000, 1000, buffer_size);
    }
}

TEST_F(SeekerTester, test_advance_from_mid_stream)
{
    std::string data(64, '\0');
    std::copy(test_marker.begin(), test_marker.end(), data.begin() + 40);
    data[56] = 'x';
    std::istringstream stream(data);
    stream.seekg(10);
    // Counting starts at the current position, not the start of the stream
    EXPECT_EQ(advance_past_next_sync_marker(stream, test_marker, 8), 46u);
    EXPECT_EQ(stream.get(), 'x');
}

} // namespace test
} // namespace blocksplit
