#include "blocksplit/test/PipelineOptionsTester.hpp"
#include "blocksplit/test/SourceTestUtils.hpp"

#include <fstream>
#include <stdexcept>

namespace blocksplit
{
namespace test
{

PipelineOptionsTester::PipelineOptionsTester(): ::testing::Test()
{
}

PipelineOptionsTester::~PipelineOptionsTester()
{
}

void PipelineOptionsTester::SetUp()
{
    _tmp_dir = make_test_directory();
}

void PipelineOptionsTester::TearDown()
{
    std::filesystem::remove_all(_tmp_dir);
}

TEST_F(PipelineOptionsTester, test_defaults)
{
    PipelineOptions options;
    EXPECT_TRUE(options.input_pattern().empty());
    EXPECT_TRUE(options.input_files().empty());
    EXPECT_EQ(options.min_bundle_size(),
              static_cast<std::uint64_t>(BLOCKSPLIT_DEFAULT_MIN_BUNDLE_SIZE));
    EXPECT_EQ(options.sync_scan_buffer_size(),
              static_cast<std::size_t>(BLOCKSPLIT_SYNC_SCAN_BUFFER_SIZE));
    EXPECT_EQ(options.nthreads(), 1u);
    EXPECT_FALSE(options.dynamic_splitting());
}

TEST_F(PipelineOptionsTester, test_read_input_file_list)
{
    auto list = _tmp_dir / "inputs.txt";
    {
        std::ofstream out(list);
        out << "# observation 1\n"
            << "/data/a.avro\n"
            << "\n"
            << "   relative/b.avro  \n"
            << "\t# indented comment\n"
            << "c.avro";
    }
    PipelineOptions options;
    options.input_files({"stale.avro"});
    options.read_input_file_list(list.string());
    EXPECT_EQ(options.input_files(),
              (std::vector<std::string>{"/data/a.avro",
                                        "relative/b.avro",
                                        "c.avro"}));
}

TEST_F(PipelineOptionsTester, test_missing_input_file_list)
{
    PipelineOptions options;
    EXPECT_THROW(
        options.read_input_file_list((_tmp_dir / "missing.txt").string()),
        std::runtime_error);
}

TEST_F(PipelineOptionsTester, test_setters)
{
    PipelineOptions options;
    options.input_pattern("/data/*.avro");
    options.desired_bundle_size(1 << 20);
    options.min_bundle_size(4096);
    options.sync_scan_buffer_size(64);
    options.nthreads(8);
    options.dynamic_splitting(true);
    options.split_check_interval_ms(5);
    EXPECT_EQ(options.input_pattern(), "/data/*.avro");
    EXPECT_EQ(options.desired_bundle_size(), 1u << 20);
    EXPECT_EQ(options.min_bundle_size(), 4096u);
    EXPECT_EQ(options.sync_scan_buffer_size(), 64u);
    EXPECT_EQ(options.nthreads(), 8u);
    EXPECT_TRUE(options.dynamic_splitting());
    EXPECT_EQ(options.split_check_interval_ms(), 5u);
    EXPECT_THROW(options.sync_scan_buffer_size(0), std::invalid_argument);
    EXPECT_NE(options.to_string().find("dynamic_splitting: true"),
              std::string::npos);
}

} // namespace test
} // namespace blocksplit
