#include "jobrunner.hpp"

#include "functions.hpp"

#include <cumulus/common/util.hpp>
#include <cumulus/function/context.hpp>
#include <cumulus/runtime/package.hpp>
#include <cumulus/storage/config.hpp>

#include <chrono>
#include <filesystem>

#include <sys/resource.h>

namespace cumulus::runtime::jobrunner {

  static double seconds_since(std::chrono::steady_clock::time_point begin)
  {
    auto elapsed = std::chrono::steady_clock::now() - begin;
    return common::util::round_to(
        std::chrono::duration_cast<std::chrono::duration<double>>(elapsed).count(), 8
    );
  }

  JobRunner::JobRunner(Config cfg) : _cfg(std::move(cfg))
  {
    _logger = common::util::create_logger("JobRunner");
  }

  void JobRunner::run()
  {
    try {
      _execute();
    } catch (std::exception& exc) {
      _logger->error("Task runner failed: {}", exc.what());
      _report_exception(ExceptionInfo::from_exception(exc), false);
    }

    struct rusage usage {};
    if (common::util::expect_zero(getrusage(RUSAGE_SELF, &usage))) {
      _stats.add("max_rss", static_cast<double>(usage.ru_maxrss));
    }
  }

  void JobRunner::_execute()
  {
    _storage = storage::ObjectStorage::construct(
        storage::config::extract_storage_config(_cfg.orchestrator_config)
    );

    auto begin = std::chrono::steady_clock::now();
    FunctionPackage package = FunctionPackage::from_bytes(_storage->get(_cfg.func_key));
    _stats.add("func_download_time", seconds_since(begin));
    _stats.add("function_name", package.function);

    FunctionsLibrary library{package, _cfg.module_path};

    begin = std::chrono::steady_clock::now();
    function::Invocation invocation;
    invocation.executor_id = _cfg.executor_id;
    invocation.job_id = _cfg.job_id;
    invocation.call_id = _cfg.call_id;
    invocation.data = _storage->get(_cfg.data_key, _cfg.data_byte_range);
    _stats.add("data_download_time", seconds_since(begin));

    function::Context context{std::filesystem::current_path()};

    _logger->info("Going to execute {}", package.function);
    begin = std::chrono::steady_clock::now();
    int return_code = 0;
    try {
      return_code = (*library.function())(invocation, context);
    } catch (std::exception& exc) {
      _stats.add("function_exec_time", seconds_since(begin));
      _logger->error("Function {} failed: {}", package.function, exc.what());
      _report_exception(ExceptionInfo::from_exception(exc), false);
      return;
    } catch (...) {
      // Only the type name of such an exception can be recovered.
      _stats.add("function_exec_time", seconds_since(begin));
      _logger->error("Function {} threw a non-standard exception", package.function);
      _report_exception(ExceptionInfo::from_current_exception(), true);
      return;
    }
    _stats.add("function_exec_time", seconds_since(begin));
    _stats.add("return_code", static_cast<double>(return_code));
    _logger->info("Success function execution, return code {}", return_code);

    if (return_code != 0) {
      ExceptionInfo info;
      info.type = "FunctionError";
      info.message = fmt::format("Function {} returned code {}", package.function, return_code);
      info.args.push_back(std::to_string(return_code));
      _report_exception(info, false);
      return;
    }

    begin = std::chrono::steady_clock::now();
    _storage->put(_cfg.output_key, context.output());
    _stats.add("output_upload_time", seconds_since(begin));
    _stats.add("result_size", static_cast<double>(context.output().size()));
    _logger->info("Storing function result - size: {}", common::util::sizeof_fmt(context.output().size()));

    std::vector<FutureRecord> futures;
    for (const auto& future : context.futures()) {
      futures.push_back(FutureRecord{future.executor_id, future.job_id, future.call_id});
    }
    _stats.add(RunnerStats::RESULT, true);
    _stats.add(RunnerStats::NEW_FUTURES, std::move(futures));
  }

  void JobRunner::_report_exception(const ExceptionInfo& info, bool serialization_failed)
  {
    _stats.add(RunnerStats::EXCEPTION, true);
    _stats.add(RunnerStats::EXC_INFO, info.to_json());
    if (serialization_failed) {
      _stats.add(RunnerStats::EXC_PICKLE_FAIL, true);
    }
  }

} // namespace cumulus::runtime::jobrunner
