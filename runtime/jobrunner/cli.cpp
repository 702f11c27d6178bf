#include <cumulus/common/util.hpp>
#include <cumulus/runtime/runner.hpp>
#include <cumulus/runtime/stats.hpp>

#include <cstdio>
#include <cstring>
#include <variant>

#include <execinfo.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "jobrunner.hpp"
#include "opts.hpp"

void failure_handler(int signum)
{
  fprintf(stderr, "Unfortunately, the task runner has crashed - signal %d.\n", signum);
  void* array[10];
  size_t size;
  // get void*'s for all entries on the stack
  size = backtrace(array, 10);
  // print out all the frames to stderr
  fprintf(stderr, "Error: signal %d:\n", signum);
  backtrace_symbols_fd(array, size, STDERR_FILENO);
  signal(signum, SIG_DFL);
  raise(signum);
}

int main(int argc, char** argv)
{
  auto options = cumulus::runtime::jobrunner::opts(argc, argv);

  // The supervisor forwards our output line by line.
  setvbuf(stdout, nullptr, _IONBF, 0);
  setvbuf(stderr, nullptr, _IONBF, 0);

  // Never outlive the supervisor.
  if (!cumulus::common::util::expect_zero(prctl(PR_SET_PDEATHSIG, SIGKILL))) {
    return 1;
  }

  if (options.verbose)
    spdlog::set_level(spdlog::level::debug);
  else
    spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");

  {
    // Report the crash and die with the same signal; the supervisor classifies it.
    struct sigaction sa;
    memset(&sa, 0, sizeof(struct sigaction));
    sigemptyset(&sa.sa_mask);
    sa.sa_handler = failure_handler;
    sa.sa_flags = 0;

    sigaction(SIGSEGV, &sa, nullptr);
    sigaction(SIGBUS, &sa, nullptr);
  }

  cumulus::runtime::jobrunner::Config config;
  try {
    config = cumulus::runtime::jobrunner::Config::read(options.config);
  } catch (std::exception& exc) {
    spdlog::error("Could not read the startup payload {}, reason: {}", options.config, exc.what());
    return 1;
  }
  if (!options.verbose && !config.log_level.empty()) {
    cumulus::common::util::set_log_level(config.log_level);
  }

  // The pipe must not leak into processes started by the function.
  if (!cumulus::common::util::expect_other(fcntl(options.result_fd, F_SETFD, FD_CLOEXEC), -1)) {
    return 1;
  }

  spdlog::info("Starting task runner for {}", config.call_id);
  cumulus::runtime::jobrunner::JobRunner runner{config};
  runner.run();

  const auto* result = runner.stats().find(cumulus::runtime::RunnerStats::RESULT);
  const bool* produced = result ? std::get_if<bool>(result) : nullptr;
  if (produced && *produced) {
    spdlog::info("Function call {} produced a result", config.call_id);
  } else {
    spdlog::warn("Function call {} finished without a result", config.call_id);
  }

  try {
    runner.stats().write(config.stats_filename);
    cumulus::runtime::jobrunner::CompletionToken::send(options.result_fd);
  } catch (std::exception& exc) {
    spdlog::error("Could not report the results, reason: {}", exc.what());
    close(options.result_fd);
    return 1;
  }
  close(options.result_fd);

  spdlog::info("Task runner is closing down");
  return 0;
}
