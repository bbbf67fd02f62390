#ifndef BLOCKSPLIT_TEST_CONCURRENT_SPLIT_TESTER_HPP
#define BLOCKSPLIT_TEST_CONCURRENT_SPLIT_TESTER_HPP

#include "blocksplit/PipelineOptions.hpp"
#include "blocksplit/Source.hpp"

#include <filesystem>
#include <gtest/gtest.h>

namespace blocksplit
{
namespace test
{

class ConcurrentSplitTester: public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

    std::filesystem::path _tmp_dir;
    PipelineOptions _options;

  public:
    ConcurrentSplitTester();
    ~ConcurrentSplitTester();
};

} // namespace test
} // namespace blocksplit

#endif // BLOCKSPLIT_TEST_CONCURRENT_SPLIT_TESTER_HPP
