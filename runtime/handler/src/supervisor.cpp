#include <cumulus/runtime/handler/supervisor.hpp>

#include <cumulus/common/exceptions.hpp>
#include <cumulus/common/util.hpp>
#include <cumulus/common/version.hpp>
#include <cumulus/runtime/exception_info.hpp>
#include <cumulus/runtime/handler/worker.hpp>
#include <cumulus/runtime/runner.hpp>
#include <cumulus/runtime/stats.hpp>
#include <cumulus/storage/config.hpp>

#include <chrono>
#include <cstdlib>
#include <map>

#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace cumulus::runtime {

  using common::InvocationFailure;

  Supervisor::Supervisor(config::Handler cfg, std::unique_ptr<QueueConnector> connector)
      : _cfg(std::move(cfg)), _scratch_root(fs::absolute(_cfg.scratch_root)),
        _delivery(std::move(connector))
  {
    _logger = common::util::create_logger("Supervisor");

    // Descendants of a killed runner are reparented to us, and we reap them.
    if (prctl(PR_SET_CHILD_SUBREAPER, 1) == -1) {
      _logger->warn("Could not become a child subreaper, reason {}", strerror(errno));
    }
  }

  void Supervisor::function_handler(const JobEvent& event)
  {
    invoke(event);
  }

  StatusRecord Supervisor::invoke(const JobEvent& event)
  {
    double start_time = common::util::timestamp();

    if (!_cfg.verbose && !event.log_level.empty()) {
      common::util::set_log_level(event.log_level);
    }
    _logger->info("Starting function execution of {}", event.invocation_key());

    StatusRecord record = StatusRecord::create(event, start_time);
    record.stats["runtime_version"] = std::string{common::VERSION};
    char* activation_id = std::getenv("CUMULUS_ACTIVATION_ID");
    if (activation_id) {
      record.stats["activation_id"] = std::string{activation_id};
    }

    std::optional<ExecutionConfig> execution_cfg;
    try {
      // A version mismatch wins over any configuration error.
      if (event.version != common::VERSION) {
        throw InvocationFailure{
            InvocationFailure::Tag::WRONGVERSION,
            fmt::format(
                "Cumulus version mismatch: host version {}, runtime version {}", event.version,
                common::VERSION
            ),
            {event.version, std::string{common::VERSION}}};
      }

      execution_cfg = ExecutionConfig::extract(event.config);
      _execute(event, execution_cfg.value(), record);
    } catch (std::exception& exc) {
      record.end_time = common::util::timestamp();
      record.exception = true;
      record.exc_info = _exception_trace(exc);
      _logger->error("There was an exception in {}: {}", event.invocation_key(), exc.what());
    }

    _finalize(event, execution_cfg, record);

    _logger->info("Finished function execution of {}", event.invocation_key());
    return record;
  }

  void Supervisor::_execute(
      const JobEvent& event, const ExecutionConfig& execution_cfg, StatusRecord& record
  )
  {
    // Fail early on a broken storage configuration; the runner needs the same settings.
    storage::config::extract_storage_config(event.config);

    _prepare_scratch();

    jobrunner::Config runner_cfg;
    runner_cfg.orchestrator_config = event.config;
    runner_cfg.executor_id = event.executor_id;
    runner_cfg.job_id = event.job_id;
    runner_cfg.call_id = event.call_id;
    runner_cfg.func_key = event.func_key;
    runner_cfg.data_key = event.data_key;
    runner_cfg.data_byte_range = event.data_byte_range;
    runner_cfg.output_key = event.output_key;
    runner_cfg.log_level = event.log_level;
    runner_cfg.stats_filename = stats_file().string();
    runner_cfg.module_path = (_scratch_root / MODULES_DIRECTORY).string();
    fs::path runner_cfg_path = _scratch_root / RUNNER_CONFIG_FILENAME;
    runner_cfg.write(runner_cfg_path);

    RunnerWorker::Spawn spawn;
    spawn.executable = fs::absolute(_cfg.runner_path).string();
    spawn.args = {"--config", runner_cfg_path.string(), "--result-fd", RunnerWorker::RESULT_FD_ARG};
    if (_cfg.verbose) {
      spawn.args.emplace_back("--verbose");
    }
    spawn.envp = _runner_environment(event);
    spawn.working_directory = _scratch_root / WORK_DIRECTORY;
    spawn.memory_limit = execution_cfg.runtime_memory;

    double setup_time = common::util::timestamp() - record.start_time;
    record.stats["setup_time"] = common::util::round_to(setup_time, 8);

    auto exec_begin = std::chrono::steady_clock::now();
    {
      RunnerWorker worker{spawn};

      bool exited = worker.wait_for(std::chrono::duration<double>{event.execution_timeout});
      int status = worker.terminate();

      if (!exited) {
        _logger->error(
            "Task runner {} exceeded {} seconds, killed its process group", worker.pid(),
            event.execution_timeout
        );
        throw InvocationFailure{
            InvocationFailure::Tag::OUTATIME,
            fmt::format(
                "Function exceeded maximum time of {} seconds and was killed",
                event.execution_timeout
            ),
            {fmt::format("{}", event.execution_timeout)}};
      }

      if (!jobrunner::CompletionToken::receive(worker.result_fd())) {
        std::string reason = RunnerWorker::describe(status);
        std::string message;
        if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
          message = fmt::format("Task runner could not be started ({})", reason);
        } else {
          message = fmt::format(
              "Function exceeded maximum memory and was killed, task runner ended with {}", reason
          );
        }
        throw InvocationFailure{InvocationFailure::Tag::OUTOFMEMORY, message, {reason}};
      }
    }

    auto exec_time = std::chrono::duration_cast<std::chrono::duration<double>>(
        std::chrono::steady_clock::now() - exec_begin
    );
    record.stats["exec_time"] = common::util::round_to(exec_time.count(), 8);

    if (fs::exists(stats_file())) {
      record.merge(RunnerStats::read(stats_file()));
    } else {
      _logger->warn("Task runner {} finished without a stats file", event.call_id);
    }

    record.end_time = common::util::timestamp();
  }

  void Supervisor::_prepare_scratch()
  {
    fs::create_directories(_scratch_root);

    // Nothing from a previous invocation may reach this record.
    fs::remove(stats_file());

    fs::path work = _scratch_root / WORK_DIRECTORY;
    fs::remove_all(work);
    fs::create_directories(work);
  }

  std::vector<std::string> Supervisor::_runner_environment(const JobEvent& event) const
  {
    std::map<std::string, std::string> env;
    for (char** var = environ; *var != nullptr; ++var) {
      std::string_view entry{*var};
      auto pos = entry.find('=');
      if (pos == std::string_view::npos) {
        continue;
      }
      env.insert_or_assign(std::string{entry.substr(0, pos)}, std::string{entry.substr(pos + 1)});
    }

    for (const auto& [name, value] : event.extra_env) {
      env.insert_or_assign(name, value);
    }

    std::string library_path = (_scratch_root / MODULES_DIRECTORY).string();
    auto it = env.find("LD_LIBRARY_PATH");
    if (it != env.end() && !it->second.empty()) {
      library_path = fmt::format("{}:{}", library_path, it->second);
    }
    env.insert_or_assign("LD_LIBRARY_PATH", library_path);

    std::vector<std::string> result;
    result.reserve(env.size());
    for (const auto& [name, value] : env) {
      result.push_back(fmt::format("{}={}", name, value));
    }
    return result;
  }

  std::string Supervisor::_exception_trace(const std::exception& exc)
  {
    ExceptionInfo info = ExceptionInfo::from_exception(exc);

    try {
      std::string trace = info.to_json();
      ExceptionInfo::from_json(trace);
      return trace;
    } catch (std::exception& secondary) {
      _logger->error("Could not serialize the exception trace: {}", secondary.what());
      return fmt::format("{}: {}", info.type, info.message);
    }
  }

  void Supervisor::_finalize(
      const JobEvent& event, const std::optional<ExecutionConfig>& execution_cfg,
      StatusRecord& record
  )
  {
    std::string payload = record.serialize();

    // Not read yet when the invocation was rejected for its version.
    std::optional<ExecutionConfig> monitoring = execution_cfg;
    if (!monitoring.has_value()) {
      try {
        monitoring = ExecutionConfig::extract(event.config);
      } catch (common::CumulusException& exc) {
        _logger->warn(
            "Status of {} is not published, reason: {}", event.invocation_key(), exc.what()
        );
      }
    }

    if (monitoring.has_value() && monitoring->rabbitmq_monitor) {
      _delivery.publish(
          monitoring->amqp_url, StatusDelivery::queue_name(event.executor_id, event.job_id),
          payload
      );
    }

    if (_cfg.store_status) {
      auto storage = storage::ObjectStorage::construct(
          storage::config::extract_storage_config(event.config)
      );
      _delivery.store(*storage, event.status_key, payload);
    }
  }

} // namespace cumulus::runtime
