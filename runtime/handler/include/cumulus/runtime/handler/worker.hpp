#ifndef CUMULUS_RUNTIME_HANDLER_WORKER_HPP
#define CUMULUS_RUNTIME_HANDLER_WORKER_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <sys/types.h>

namespace cumulus::runtime {

  /**
   * @brief A task runner child process, started in its own process group.
   *
   * The worker owns the read end of the completion pipe and a pidfd of the child.
   * The destructor kills and reaps whatever is left of the group.
   */
  struct RunnerWorker {

    struct Spawn {
      std::string executable;
      std::vector<std::string> args;
      std::vector<std::string> envp;
      std::filesystem::path working_directory;

      // Address-space limit in MiB; zero disables it.
      long memory_limit = 0;
    };

    RunnerWorker(const Spawn& spawn);
    RunnerWorker(const RunnerWorker&) = delete;
    RunnerWorker(RunnerWorker&&) = delete;
    RunnerWorker& operator=(const RunnerWorker&) = delete;
    RunnerWorker& operator=(RunnerWorker&&) = delete;
    ~RunnerWorker();

    // Placeholder in the argument list, replaced with the descriptor of the pipe's write end.
    static constexpr char RESULT_FD_ARG[] = "{result_fd}";

    /**
     * @brief Blocks until the runner exits or the timeout expires.
     * Timeouts beyond the range of steady_clock never expire.
     *
     * @return true when the runner has exited
     */
    bool wait_for(std::chrono::duration<double> timeout);

    /**
     * @brief Kills the whole process group, reaps the runner and every descendant that
     * was reparented to us. Safe to call after the runner has exited.
     *
     * @return the wait status of the runner
     */
    int terminate();

    int result_fd() const
    {
      return _result_read;
    }

    pid_t pid() const
    {
      return _pid;
    }

    // Human-readable description of a wait status.
    static std::string describe(int status);

  private:
    void _kill_group();
    void _reap_descendants();

    pid_t _pid = -1;
    int _pidfd = -1;
    int _result_read = -1;
    bool _reaped = false;
    int _status = 0;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace cumulus::runtime

#endif
