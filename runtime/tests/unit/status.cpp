#include <cumulus/common/exceptions.hpp>
#include <cumulus/runtime/job.hpp>
#include <cumulus/runtime/status.hpp>

#include <gtest/gtest.h>

using namespace cumulus::runtime;

static JobEvent make_event()
{
  JobEvent event;
  event.executor_id = "exec";
  event.job_id = "A001";
  event.call_id = "00000";
  event.host_submit_time = 100.25;
  return event;
}

TEST(StatusRecord, Create)
{
  auto record = StatusRecord::create(make_event(), 200.5);

  EXPECT_FALSE(record.exception);
  EXPECT_EQ(record.executor_id, "exec");
  EXPECT_EQ(record.job_id, "A001");
  EXPECT_EQ(record.call_id, "00000");
  EXPECT_DOUBLE_EQ(record.host_submit_time, 100.25);
  EXPECT_DOUBLE_EQ(record.start_time, 200.5);
  EXPECT_FALSE(record.result.has_value());
}

TEST(StatusRecord, MergeStats)
{
  RunnerStats stats;
  stats.add("function_exec_time", 1.23456789);
  stats.add("function_name", "add");
  stats.add(RunnerStats::RESULT, true);
  stats.add(RunnerStats::NEW_FUTURES, std::vector<FutureRecord>{{"exec", "A002", "00000"}});
  // Identity of the invocation belongs to the supervisor.
  stats.add("call_id", "99999");

  auto record = StatusRecord::create(make_event(), 0);
  record.merge(stats);

  EXPECT_FALSE(record.exception);
  EXPECT_EQ(record.call_id, "00000");
  EXPECT_DOUBLE_EQ(record.number("function_exec_time").value(), 1.23456789);
  EXPECT_EQ(record.text("function_name").value(), "add");
  EXPECT_FALSE(record.number("function_name").has_value());
  EXPECT_TRUE(record.result.value());
  ASSERT_EQ(record.new_futures->size(), 1);
  EXPECT_EQ(record.new_futures->at(0).job_id, "A002");
}

TEST(StatusRecord, MergeException)
{
  RunnerStats stats;
  stats.add(RunnerStats::EXCEPTION, true);
  stats.add(RunnerStats::EXC_PICKLE_FAIL, true);
  stats.add(RunnerStats::EXC_INFO, "{\"exception\": {}}");

  auto record = StatusRecord::create(make_event(), 0);
  record.merge(stats);

  EXPECT_TRUE(record.exception);
  EXPECT_TRUE(record.exc_pickle_fail.value());
  EXPECT_EQ(record.exc_info.value(), "{\"exception\": {}}");
  EXPECT_FALSE(record.result.has_value());
}

TEST(StatusRecord, SerializeRoundTrip)
{
  auto record = StatusRecord::create(make_event(), 1600000000.123);
  record.end_time = 1600000001.987;
  record.stats["setup_time"] = 0.12345678;
  record.stats["exec_time"] = 1.23456789;
  record.stats["function_name"] = std::string{"my_function"};
  record.result = true;
  record.new_futures = std::vector<FutureRecord>{{"exec", "A001", "00001"}};

  auto copy = StatusRecord::deserialize(record.serialize());

  EXPECT_FALSE(copy.exception);
  EXPECT_EQ(copy.call_id, record.call_id);
  EXPECT_EQ(copy.job_id, record.job_id);
  EXPECT_EQ(copy.executor_id, record.executor_id);
  EXPECT_DOUBLE_EQ(copy.start_time, record.start_time);
  EXPECT_DOUBLE_EQ(copy.end_time, record.end_time);
  EXPECT_DOUBLE_EQ(copy.host_submit_time, record.host_submit_time);
  EXPECT_DOUBLE_EQ(copy.number("exec_time").value(), 1.23456789);
  EXPECT_DOUBLE_EQ(copy.number("setup_time").value(), 0.12345678);
  EXPECT_EQ(copy.text("function_name").value(), "my_function");
  EXPECT_TRUE(copy.result.value());
  EXPECT_EQ(copy.new_futures.value(), record.new_futures.value());
  EXPECT_FALSE(copy.exc_info.has_value());
}

TEST(StatusRecord, DeserializeInvalid)
{
  using cumulus::common::InvalidJSON;

  EXPECT_THROW(StatusRecord::deserialize("[1, 2]"), InvalidJSON);
  EXPECT_THROW(StatusRecord::deserialize(R"({"call_id": "0"})"), InvalidJSON);
  EXPECT_THROW(StatusRecord::deserialize(R"({"exception": "yes"})"), InvalidJSON);
  EXPECT_THROW(StatusRecord::deserialize(R"({"exception": false, "extra": [1]})"), InvalidJSON);
}
