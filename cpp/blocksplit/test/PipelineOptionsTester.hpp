#ifndef BLOCKSPLIT_TEST_PIPELINE_OPTIONS_TESTER_HPP
#define BLOCKSPLIT_TEST_PIPELINE_OPTIONS_TESTER_HPP

#include "blocksplit/PipelineOptions.hpp"

#include <filesystem>
#include <gtest/gtest.h>

namespace blocksplit
{
namespace test
{

class PipelineOptionsTester: public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

    std::filesystem::path _tmp_dir;

  public:
    PipelineOptionsTester();
    ~PipelineOptionsTester();
};

} // namespace test
} // namespace blocksplit

#endif // BLOCKSPLIT_TEST_PIPELINE_OPTIONS_TESTER_HPP
