#ifndef BLOCKSPLIT_TEST_SCHEMA_TESTER_HPP
#define BLOCKSPLIT_TEST_SCHEMA_TESTER_HPP

#include "blocksplit/GenericRecord.hpp"
#include "blocksplit/Schema.hpp"

#include <gtest/gtest.h>

namespace blocksplit
{
namespace test
{

class SchemaTester: public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

  public:
    SchemaTester();
    ~SchemaTester();
};

} // namespace test
} // namespace blocksplit

#endif // BLOCKSPLIT_TEST_SCHEMA_TESTER_HPP
