#include <cumulus/common/exceptions.hpp>
#include <cumulus/common/util.hpp>

#include <gtest/gtest.h>

using namespace cumulus::common;

TEST(Util, StrToBool)
{
  for (auto val : {"y", "Yes", "t", "TRUE", "on", "1"}) {
    EXPECT_TRUE(util::strtobool(val)) << val;
  }
  for (auto val : {"n", "NO", "f", "False", "off", "0"}) {
    EXPECT_FALSE(util::strtobool(val)) << val;
  }
  EXPECT_THROW(util::strtobool("maybe"), InvalidConfigurationError);
  EXPECT_THROW(util::strtobool(""), InvalidConfigurationError);
}

TEST(Util, SizeofFmt)
{
  EXPECT_EQ(util::sizeof_fmt(0), "0.0B");
  EXPECT_EQ(util::sizeof_fmt(1023), "1023.0B");
  EXPECT_EQ(util::sizeof_fmt(1536), "1.5KiB");
  EXPECT_EQ(util::sizeof_fmt(5.0 * 1024 * 1024), "5.0MiB");
}

TEST(Util, RoundTo)
{
  EXPECT_DOUBLE_EQ(util::round_to(1.234567891234, 8), 1.23456789);
  EXPECT_DOUBLE_EQ(util::round_to(0.5, 0), 1.0);
  EXPECT_DOUBLE_EQ(util::round_to(2.0, 8), 2.0);
}

TEST(Util, CheckPosix)
{
  EXPECT_EQ(util::check_posix(5, "test"), 5);
  errno = ENOENT;
  EXPECT_THROW(util::check_posix(-1, "test"), CumulusException);
}

TEST(Util, LoggerFollowsLogLevel)
{
  util::set_log_level("INFO");
  auto logger = util::create_logger("LevelTest");
  EXPECT_TRUE(logger->should_log(spdlog::level::info));

  util::set_log_level("ERROR");
  EXPECT_FALSE(logger->should_log(spdlog::level::info));
  EXPECT_TRUE(logger->should_log(spdlog::level::err));
  EXPECT_EQ(util::create_logger("LevelTest"), logger);

  util::set_log_level("DEBUG");
  EXPECT_TRUE(logger->should_log(spdlog::level::debug));

  util::set_log_level("INFO");
}

TEST(Exceptions, InvocationFailureTag)
{
  InvocationFailure failure{InvocationFailure::Tag::OUTATIME, "timeout", {"10"}};

  EXPECT_EQ(failure.tag(), InvocationFailure::Tag::OUTATIME);
  EXPECT_EQ(InvocationFailure::tag_name(failure.tag()), "OUTATIME");
  ASSERT_EQ(failure.args().size(), 1);
  EXPECT_EQ(failure.args()[0], "10");
  EXPECT_STREQ(failure.what(), "timeout");

  EXPECT_EQ(InvocationFailure::tag_name(InvocationFailure::Tag::WRONGVERSION), "WRONGVERSION");
  EXPECT_EQ(InvocationFailure::tag_name(InvocationFailure::Tag::OUTOFMEMORY), "OUTOFMEMORY");
}
