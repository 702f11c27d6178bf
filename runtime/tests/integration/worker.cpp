#include <cumulus/runtime/handler/worker.hpp>

#include <chrono>
#include <filesystem>

#include <sys/wait.h>

#include <gtest/gtest.h>

using namespace cumulus::runtime;

static RunnerWorker::Spawn sleep_for(const std::string& seconds)
{
  RunnerWorker::Spawn spawn;
  spawn.executable = "/bin/sleep";
  spawn.args = {seconds};
  spawn.working_directory = std::filesystem::temp_directory_path();
  return spawn;
}

TEST(RunnerWorker, FractionalTimeout)
{
  RunnerWorker worker{sleep_for("30")};

  auto begin = std::chrono::steady_clock::now();
  bool exited = worker.wait_for(std::chrono::duration<double>{0.5});
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_FALSE(exited);
  EXPECT_GE(elapsed, std::chrono::milliseconds{450});
  EXPECT_LT(elapsed, std::chrono::seconds{5});

  int status = worker.terminate();
  EXPECT_TRUE(WIFSIGNALED(status));
}

TEST(RunnerWorker, TimeoutBeyondPollRange)
{
  RunnerWorker worker{sleep_for("1")};

  auto begin = std::chrono::steady_clock::now();
  // More than INT_MAX milliseconds, and more than UINT_MAX milliseconds.
  bool exited = worker.wait_for(std::chrono::seconds{4294968});
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_TRUE(exited);
  EXPECT_GE(elapsed, std::chrono::milliseconds{900});

  int status = worker.terminate();
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(RunnerWorker, UnboundedTimeout)
{
  RunnerWorker worker{sleep_for("0.2")};

  EXPECT_TRUE(worker.wait_for(std::chrono::duration<double>{1e300}));
  int status = worker.terminate();
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}
