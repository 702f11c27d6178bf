#ifndef CUMULUS_RUNTIME_HANDLER_SUPERVISOR_HPP
#define CUMULUS_RUNTIME_HANDLER_SUPERVISOR_HPP

#include <cumulus/runtime/handler/config.hpp>
#include <cumulus/runtime/handler/delivery.hpp>
#include <cumulus/runtime/job.hpp>
#include <cumulus/runtime/status.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace cumulus::runtime {

  /**
   * @brief Entry point of a compute backend. Runs one job event at a time in a sandboxed
   * task runner and produces exactly one status record per event.
   */
  struct Supervisor {

    static constexpr char STATS_FILENAME[] = "jobrunner.stats.json";
    static constexpr char RUNNER_CONFIG_FILENAME[] = "jobrunner.config.json";
    static constexpr char MODULES_DIRECTORY[] = "modules";
    static constexpr char WORK_DIRECTORY[] = "work";

    Supervisor(config::Handler cfg, std::unique_ptr<QueueConnector> connector);

    /**
     * @brief Executes the event and delivers its status record.
     *
     * Failures of the invocation are recorded in the status record; only a failed durable
     * write of that record escapes.
     */
    StatusRecord invoke(const JobEvent& event);

    // Backend-facing variant; the outcome travels only through the status record.
    void function_handler(const JobEvent& event);

    std::filesystem::path stats_file() const
    {
      return _scratch_root / STATS_FILENAME;
    }

  private:
    void _execute(
        const JobEvent& event, const ExecutionConfig& execution_cfg, StatusRecord& record
    );

    void _prepare_scratch();

    std::vector<std::string> _runner_environment(const JobEvent& event) const;

    std::string _exception_trace(const std::exception& exc);

    void _finalize(
        const JobEvent& event, const std::optional<ExecutionConfig>& execution_cfg,
        StatusRecord& record
    );

    config::Handler _cfg;

    std::filesystem::path _scratch_root;

    StatusDelivery _delivery;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace cumulus::runtime

#endif
