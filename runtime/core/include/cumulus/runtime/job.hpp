#ifndef CUMULUS_RUNTIME_JOB_HPP
#define CUMULUS_RUNTIME_JOB_HPP

#include <cumulus/storage/storage.hpp>

#include <istream>
#include <map>
#include <optional>
#include <string>

namespace cumulus::runtime {

  /**
   * @brief One invocation to execute, as built by the orchestrator and handed over by the
   * compute backend.
   */
  struct JobEvent {

    // Seconds.
    static constexpr double DEFAULT_EXECUTION_TIMEOUT = 590.0;
    // Longer timeouts cannot be turned into a steady_clock deadline.
    static constexpr double MAX_EXECUTION_TIMEOUT = 1e9;

    std::string executor_id;
    std::string job_id;
    std::string call_id;

    // Full orchestrator configuration, kept as serialized JSON.
    std::string config;

    std::string func_key;
    std::string data_key;
    std::optional<storage::ByteRange> data_byte_range;
    std::string output_key;
    std::string status_key;

    std::string log_level;
    double execution_timeout = DEFAULT_EXECUTION_TIMEOUT;
    std::map<std::string, std::string> extra_env;
    double host_submit_time{};

    std::string version;

    std::string invocation_key() const;

    std::string serialize() const;

    static JobEvent deserialize(std::istream& in);
    static JobEvent deserialize(const std::string& json);
  };

  /**
   * @brief Runtime options the supervisor reads out of the orchestrator configuration.
   */
  struct ExecutionConfig {

    bool rabbitmq_monitor = false;
    std::string amqp_url;

    // Address-space limit of the task runner in MiB; zero disables the limit.
    long runtime_memory = 0;

    static ExecutionConfig extract(const std::string& config_json);
  };

} // namespace cumulus::runtime

#endif
