#ifndef CUMULUS_RUNTIME_JOBRUNNER_JOBRUNNER_HPP
#define CUMULUS_RUNTIME_JOBRUNNER_JOBRUNNER_HPP

#include <cumulus/runtime/exception_info.hpp>
#include <cumulus/runtime/runner.hpp>
#include <cumulus/runtime/stats.hpp>
#include <cumulus/storage/storage.hpp>

#include <memory>

#include <spdlog/spdlog.h>

namespace cumulus::runtime::jobrunner {

  /**
   * @brief Executes one user function call and collects everything the supervisor needs into
   * RunnerStats. Failures of user code and of the runner itself are recorded, never thrown.
   */
  struct JobRunner {

    JobRunner(Config cfg);

    void run();

    const RunnerStats& stats() const
    {
      return _stats;
    }

  private:
    void _execute();

    void _report_exception(const ExceptionInfo& info, bool serialization_failed);

    Config _cfg;

    RunnerStats _stats;

    std::unique_ptr<storage::ObjectStorage> _storage;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace cumulus::runtime::jobrunner

#endif
