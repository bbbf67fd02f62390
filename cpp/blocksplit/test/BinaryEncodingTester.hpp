#ifndef BLOCKSPLIT_TEST_BINARY_ENCODING_TESTER_HPP
#define BLOCKSPLIT_TEST_BINARY_ENCODING_TESTER_HPP

#include "blocksplit/BinaryEncoding.hpp"

#include <gtest/gtest.h>

namespace blocksplit
{
namespace test
{

class BinaryEncodingTester: public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

  public:
    BinaryEncodingTester();
    ~BinaryEncodingTester();
};

} // namespace test
} // namespace blocksplit

#endif // BLOCKSPLIT_TEST_BINARY_ENCODING_TESTER_HPP
