#include <cumulus/common/exceptions.hpp>
#include <cumulus/runtime/stats.hpp>

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include <unistd.h>

using namespace cumulus::runtime;

class RunnerStatsTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    path = std::filesystem::temp_directory_path() /
           ("cumulus-stats-test-" + std::to_string(getpid()) + ".json");
  }

  void TearDown() override
  {
    std::filesystem::remove(path);
  }

  std::filesystem::path path;
};

TEST_F(RunnerStatsTest, WriteRead)
{
  RunnerStats stats;
  stats.add("exec_time", 1.23456789);
  stats.add("max_rss", 1024.0);
  stats.add("function_name", std::string{"compute"});
  stats.add(RunnerStats::RESULT, true);
  stats.add(RunnerStats::NEW_FUTURES, std::vector<FutureRecord>{{"e", "j", "c"}});
  stats.write(path);

  auto read = RunnerStats::read(path);
  ASSERT_EQ(read.entries.size(), 5);

  auto* exec_time = read.find("exec_time");
  ASSERT_NE(exec_time, nullptr);
  EXPECT_DOUBLE_EQ(std::get<double>(*exec_time), 1.23456789);
  EXPECT_EQ(std::get<std::string>(*read.find("function_name")), "compute");
  EXPECT_TRUE(std::get<bool>(*read.find(RunnerStats::RESULT)));

  auto& futures = std::get<std::vector<FutureRecord>>(*read.find(RunnerStats::NEW_FUTURES));
  ASSERT_EQ(futures.size(), 1);
  EXPECT_EQ(futures[0], (FutureRecord{"e", "j", "c"}));
}

TEST_F(RunnerStatsTest, LastEntryWins)
{
  RunnerStats stats;
  stats.add("return_code", 0.0);
  stats.add("return_code", 1.0);

  EXPECT_DOUBLE_EQ(std::get<double>(*stats.find("return_code")), 1.0);
  EXPECT_EQ(stats.find("missing"), nullptr);
}

TEST_F(RunnerStatsTest, Validate)
{
  RunnerStats stats;
  stats.add(RunnerStats::EXCEPTION, std::string{"True"});
  EXPECT_THROW(stats.validate(), cumulus::common::StatsFormatError);

  RunnerStats futures;
  futures.add(RunnerStats::NEW_FUTURES, 1.0);
  EXPECT_THROW(futures.validate(), cumulus::common::StatsFormatError);

  RunnerStats flag;
  flag.add("custom_flag", true);
  EXPECT_THROW(flag.validate(), cumulus::common::StatsFormatError);
}

TEST_F(RunnerStatsTest, Corrupted)
{
  {
    std::ofstream out{path};
    out << "exec_time 1.5\n";
  }
  EXPECT_THROW(RunnerStats::read(path), cumulus::common::StatsFormatError);

  EXPECT_THROW(
      RunnerStats::read(path.parent_path() / "cumulus-nonexistent-stats.json"),
      cumulus::common::StatsFormatError
  );
}
