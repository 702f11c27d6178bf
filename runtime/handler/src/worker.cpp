#include <cumulus/runtime/handler/worker.hpp>

#include <cumulus/common/exceptions.hpp>
#include <cumulus/common/util.hpp>

#include <cerrno>
#include <cstring>
#include <limits>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cumulus::runtime {

  static int pidfd_open(pid_t pid)
  {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
  }

  RunnerWorker::RunnerWorker(const Spawn& spawn)
  {
    _logger = common::util::create_logger("RunnerWorker");

    // The pipe must exist before we fork - the runner inherits only the write end.
    int fds[2];
    common::util::check_posix(pipe2(fds, O_CLOEXEC), "pipe2");
    int result_write = fds[1];
    _result_read = fds[0];

    // Everything the child needs is allocated before the fork.
    std::string result_fd = std::to_string(result_write);
    std::vector<const char*> argv;
    argv.push_back(spawn.executable.c_str());
    for (const auto& arg : spawn.args) {
      argv.push_back(arg == RESULT_FD_ARG ? result_fd.c_str() : arg.c_str());
    }
    argv.push_back(nullptr);

    std::vector<const char*> envp;
    for (const auto& var : spawn.envp) {
      envp.push_back(var.c_str());
    }
    envp.push_back(nullptr);

    rlimit memory_limit{};
    memory_limit.rlim_cur = memory_limit.rlim_max =
        static_cast<rlim_t>(spawn.memory_limit) * 1024 * 1024;

    int mypid = fork();
    if (mypid < 0) {
      close(result_write);
      close(_result_read);
      throw common::CumulusException{
          fmt::format("Fork failed! {}, reason {} {}", mypid, errno, strerror(errno))};
    }

    if (mypid == 0) {

      // Only async-signal-safe calls from here on.
      setpgid(0, 0);

      if (fcntl(result_write, F_SETFD, 0) == -1) {
        _exit(127);
      }
      if (chdir(spawn.working_directory.c_str()) == -1) {
        _exit(127);
      }
      if (spawn.memory_limit > 0 && setrlimit(RLIMIT_AS, &memory_limit) == -1) {
        _exit(127);
      }

      execve(argv[0], const_cast<char**>(argv.data()), const_cast<char**>(envp.data()));

      const char msg[] = "Could not execute the task runner\n";
      [[maybe_unused]] auto ret = write(STDERR_FILENO, msg, sizeof(msg) - 1);
      _exit(127);
    }

    _pid = mypid;
    close(result_write);

    // Both sides call setpgid - the group exists no matter which one runs first.
    if (setpgid(_pid, _pid) == -1 && errno != EACCES && errno != ESRCH) {
      _logger->warn("setpgid of the task runner {} failed, reason {}", _pid, strerror(errno));
    }

    try {
      common::util::check_posix(
          fcntl(_result_read, F_SETFL, fcntl(_result_read, F_GETFL) | O_NONBLOCK), "fcntl"
      );
      _pidfd = common::util::check_posix(pidfd_open(_pid), "pidfd_open");
    } catch (common::CumulusException&) {
      terminate();
      close(_result_read);
      throw;
    }

    _logger->info("Started task runner process with PID {}", _pid);
  }

  RunnerWorker::~RunnerWorker()
  {
    if (!_reaped) {
      terminate();
    }
    if (_pidfd != -1) {
      close(_pidfd);
    }
    if (_result_read != -1) {
      close(_result_read);
    }
  }

  bool RunnerWorker::wait_for(std::chrono::duration<double> timeout)
  {
    using clock = std::chrono::steady_clock;

    auto now = clock::now();
    auto deadline = clock::time_point::max();
    if (!(timeout.count() > 0)) {
      deadline = now;
    } else if (timeout < std::chrono::duration<double>{deadline - now}) {
      deadline = now + std::chrono::duration_cast<clock::duration>(timeout);
    }

    while (true) {

      auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - clock::now());
      int slice = 0;
      if (remaining.count() > std::numeric_limits<int>::max()) {
        slice = std::numeric_limits<int>::max();
      } else if (remaining.count() > 0) {
        slice = static_cast<int>(remaining.count());
      }

      pollfd pfd{_pidfd, POLLIN, 0};
      int ret = poll(&pfd, 1, slice);

      if (ret > 0) {
        return true;
      }
      if (ret == 0) {
        // poll waits at most INT_MAX milliseconds at a time.
        if (clock::now() >= deadline) {
          return false;
        }
        continue;
      }
      if (errno != EINTR) {
        common::util::check_posix(ret, "poll");
      }
    }
  }

  int RunnerWorker::terminate()
  {
    if (_reaped) {
      return _status;
    }

    // The runner is not reaped yet, so its PID cannot be reused as a group id.
    _kill_group();

    int ret = 0;
    do {
      ret = waitpid(_pid, &_status, 0);
    } while (ret == -1 && errno == EINTR);
    common::util::check_posix(ret, "waitpid");
    _reaped = true;

    _reap_descendants();

    SPDLOG_LOGGER_DEBUG(_logger, "Task runner {} finished with {}", _pid, describe(_status));
    return _status;
  }

  void RunnerWorker::_kill_group()
  {
    if (kill(-_pid, SIGKILL) == 0) {
      return;
    }

    // The child might not have reached setpgid yet.
    if (kill(_pid, SIGKILL) == -1 && errno != ESRCH) {
      _logger->error("Could not kill the task runner {}, reason {}", _pid, strerror(errno));
    }
    kill(-_pid, SIGKILL);
  }

  void RunnerWorker::_reap_descendants()
  {
    // Orphans of the group are reparented to us when we are a child subreaper.
    int status = 0;
    while (true) {
      pid_t child = waitpid(-_pid, &status, 0);
      if (child > 0) {
        SPDLOG_LOGGER_DEBUG(_logger, "Reaped descendant {} of task runner {}", child, _pid);
        continue;
      }
      if (errno == EINTR) {
        continue;
      }
      break;
    }
  }

  std::string RunnerWorker::describe(int status)
  {
    if (WIFEXITED(status)) {
      return fmt::format("exit code {}", WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
      int sig = WTERMSIG(status);
      return fmt::format("signal {} ({})", sig, strsignal(sig));
    }
    return fmt::format("unknown status {}", status);
  }

} // namespace cumulus::runtime
